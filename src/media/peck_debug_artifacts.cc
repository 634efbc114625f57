#include "peck_debug_artifacts.h"
#include "peck_image_io.h"
#include "logger.h"
#include <cairo/cairo.h>
#include <algorithm>
#include <cmath>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

PeckDebugArtifacts::PeckDebugArtifacts(const std::string& directory)
    : directory_(directory) {
  // Strip trailing slash so paths join cleanly
  while (directory_.size() > 1 && directory_.back() == '/') {
    directory_.pop_back();
  }
}

void PeckDebugArtifacts::SaveCapture(const CaptureImage& capture) {
  if (Save(capture, "capture.png")) {
    LOG_INFO("Debug", "Saved capture to " + directory_ + "/capture.png");
  }
}

void PeckDebugArtifacts::SaveOverlay(const GridOverlayImage& overlay) {
  if (Save(overlay, "overlay.png")) {
    LOG_INFO("Debug", "Saved grid overlay to " + directory_ + "/overlay.png");
  }
}

void PeckDebugArtifacts::SaveTargetCheck(const CaptureImage& capture, const GridCell& cell,
                                         const TargetPoint& target) {
  if (!IsEnabled()) {
    return;
  }
  if (Save(RenderTargetCheck(capture, cell, target), "target_check.png")) {
    LOG_INFO("Debug", "Saved target check to " + directory_ + "/target_check.png");
  }
}

RasterImage PeckDebugArtifacts::RenderTargetCheck(const CaptureImage& capture,
                                                  const GridCell& cell,
                                                  const TargetPoint& target) {
  if (!capture.IsValid()) {
    return RasterImage();
  }

  RasterImage marked = capture;
  cairo_surface_t* surface = cairo_image_surface_create_for_data(
      marked.pixels.data(), CAIRO_FORMAT_ARGB32, marked.width, marked.height, marked.stride);
  if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
    cairo_surface_destroy(surface);
    return RasterImage();
  }

  cairo_t* cr = cairo_create(surface);

  // Cell outline (green, 2px)
  cairo_set_source_rgb(cr, 0.0, 1.0, 0.0);
  cairo_set_line_width(cr, 2.0);
  cairo_rectangle(cr, cell.origin_x + 1, cell.origin_y + 1,
                  std::max(1, cell.width - 2), std::max(1, cell.height - 2));
  cairo_stroke(cr);

  // Click point (red, radius 10)
  cairo_set_source_rgb(cr, 1.0, 0.0, 0.0);
  cairo_arc(cr, target.physical_x + 0.5, target.physical_y + 0.5, 10.0, 0, 2 * M_PI);
  cairo_fill(cr);

  cairo_destroy(cr);
  cairo_surface_flush(surface);
  cairo_surface_destroy(surface);
  return marked;
}

bool PeckDebugArtifacts::Save(const RasterImage& image, const std::string& file_name) {
  if (!IsEnabled()) {
    return false;
  }

  if (mkdir(directory_.c_str(), 0755) != 0 && errno != EEXIST) {
    LOG_WARN("Debug", "Cannot create debug directory " + directory_ + ": " + strerror(errno));
    return false;
  }

  std::string error;
  if (!PeckImageIO::SavePNG(image, directory_ + "/" + file_name, error)) {
    LOG_WARN("Debug", "Failed to save " + file_name + ": " + error);
    return false;
  }
  return true;
}
