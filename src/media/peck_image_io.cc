#include "peck_image_io.h"
#include "logger.h"
#include <cairo/cairo.h>
#include <cstring>

namespace PeckImageIO {

namespace {

struct PngWriteData {
  std::vector<uint8_t>* buffer;
};

cairo_status_t PngWriteFunc(void* closure, const unsigned char* data, unsigned int length) {
  PngWriteData* wd = static_cast<PngWriteData*>(closure);
  wd->buffer->insert(wd->buffer->end(), data, data + length);
  return CAIRO_STATUS_SUCCESS;
}

// Cairo never writes through this surface; the const_cast only satisfies the API
cairo_surface_t* WrapImage(const RasterImage& image) {
  return cairo_image_surface_create_for_data(
      const_cast<unsigned char*>(image.pixels.data()), CAIRO_FORMAT_ARGB32,
      image.width, image.height, image.stride);
}

}  // namespace

std::vector<uint8_t> EncodePNG(const RasterImage& image) {
  std::vector<uint8_t> result;
  if (!image.IsValid()) {
    LOG_ERROR("ImageIO", "Cannot encode an empty image");
    return result;
  }

  cairo_surface_t* surface = WrapImage(image);
  if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
    LOG_ERROR("ImageIO", "Failed to create Cairo surface: " +
              std::string(cairo_status_to_string(cairo_surface_status(surface))));
    cairo_surface_destroy(surface);
    return result;
  }

  PngWriteData write_data;
  write_data.buffer = &result;

  cairo_status_t status = cairo_surface_write_to_png_stream(surface, PngWriteFunc, &write_data);
  if (status != CAIRO_STATUS_SUCCESS) {
    LOG_ERROR("ImageIO", "Failed to encode PNG: " + std::string(cairo_status_to_string(status)));
    result.clear();
  } else {
    LOG_DEBUG("ImageIO", "Encoded " + std::to_string(image.width) + "x" +
              std::to_string(image.height) + " PNG, " + std::to_string(result.size()) + " bytes");
  }

  cairo_surface_destroy(surface);
  return result;
}

bool SavePNG(const RasterImage& image, const std::string& path, std::string& error) {
  if (!image.IsValid()) {
    error = "empty image";
    return false;
  }

  cairo_surface_t* surface = WrapImage(image);
  cairo_status_t status = cairo_surface_status(surface);
  if (status == CAIRO_STATUS_SUCCESS) {
    status = cairo_surface_write_to_png(surface, path.c_str());
  }
  cairo_surface_destroy(surface);

  if (status != CAIRO_STATUS_SUCCESS) {
    error = std::string(cairo_status_to_string(status)) + " (" + path + ")";
    return false;
  }
  return true;
}

bool LoadPNG(const std::string& path, RasterImage& image, std::string& error) {
  cairo_surface_t* loaded = cairo_image_surface_create_from_png(path.c_str());
  cairo_status_t status = cairo_surface_status(loaded);
  if (status != CAIRO_STATUS_SUCCESS) {
    error = std::string(cairo_status_to_string(status)) + " (" + path + ")";
    cairo_surface_destroy(loaded);
    return false;
  }

  int width = cairo_image_surface_get_width(loaded);
  int height = cairo_image_surface_get_height(loaded);

  // Normalize RGB24/A8/etc. into ARGB32 by painting onto a fresh surface
  RasterImage converted = RasterImage::Create(width, height);
  if (!converted.IsValid()) {
    error = "empty PNG (" + path + ")";
    cairo_surface_destroy(loaded);
    return false;
  }

  cairo_surface_t* target = cairo_image_surface_create_for_data(
      converted.pixels.data(), CAIRO_FORMAT_ARGB32, width, height, converted.stride);
  cairo_t* cr = cairo_create(target);
  cairo_set_source_surface(cr, loaded, 0, 0);
  cairo_paint(cr);
  cairo_destroy(cr);
  cairo_surface_flush(target);

  status = cairo_surface_status(target);
  cairo_surface_destroy(target);
  cairo_surface_destroy(loaded);

  if (status != CAIRO_STATUS_SUCCESS) {
    error = std::string(cairo_status_to_string(status)) + " (" + path + ")";
    return false;
  }

  image = std::move(converted);
  return true;
}

}  // namespace PeckImageIO
