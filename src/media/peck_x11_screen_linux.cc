#include "peck_screen_capture.h"
#include "logger.h"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <cstring>
#include <memory>

namespace {

struct DisplayDeleter {
  void operator()(Display* display) {
    if (display) XCloseDisplay(display);
  }
};
using DisplayPtr = std::unique_ptr<Display, DisplayDeleter>;

struct XImageDeleter {
  void operator()(XImage* image) {
    if (image) XDestroyImage(image);
  }
};
using XImagePtr = std::unique_ptr<XImage, XImageDeleter>;

// Bit offset of the lowest set bit of a channel mask
int MaskShift(unsigned long mask) {
  int shift = 0;
  while (mask && !(mask & 1)) {
    mask >>= 1;
    shift++;
  }
  return shift;
}

}  // namespace

PeckX11ScreenCapture::PeckX11ScreenCapture(const std::string& display_name)
    : display_name_(display_name) {}

CaptureResult PeckX11ScreenCapture::Capture() {
  CaptureResult result;

  DisplayPtr display(XOpenDisplay(display_name_.empty() ? nullptr : display_name_.c_str()));
  if (!display) {
    result.error = "Failed to open X11 display" +
                   (display_name_.empty() ? std::string() : " " + display_name_);
    LOG_ERROR("ScreenCapture", result.error);
    return result;
  }

  // The root window covers the whole virtual screen across monitors
  Window root = DefaultRootWindow(display.get());
  XWindowAttributes root_attrs;
  if (!XGetWindowAttributes(display.get(), root, &root_attrs)) {
    result.error = "Failed to get root window attributes";
    LOG_ERROR("ScreenCapture", result.error);
    return result;
  }

  int width = root_attrs.width;
  int height = root_attrs.height;
  if (width <= 0 || height <= 0) {
    result.error = "Root window has no area";
    LOG_ERROR("ScreenCapture", result.error);
    return result;
  }

  XImagePtr ximage(XGetImage(display.get(), root, 0, 0, width, height, AllPlanes, ZPixmap));
  if (!ximage) {
    result.error = "XGetImage failed";
    LOG_ERROR("ScreenCapture", result.error);
    return result;
  }

  LOG_DEBUG("ScreenCapture", "XImage captured: " + std::to_string(ximage->width) + "x" +
            std::to_string(ximage->height) + " depth=" + std::to_string(ximage->depth) +
            " bpp=" + std::to_string(ximage->bits_per_pixel));

  CaptureImage image = CaptureImage::Create(width, height);

  int red_shift = MaskShift(ximage->red_mask);
  int green_shift = MaskShift(ximage->green_mask);
  int blue_shift = MaskShift(ximage->blue_mask);

  // Common 24/32-bit TrueColor layout already matches ARGB32 byte order
  bool direct_copy = ximage->bits_per_pixel == 32 &&
                     ximage->byte_order == LSBFirst &&
                     ximage->red_mask == 0xFF0000 &&
                     ximage->green_mask == 0x00FF00 &&
                     ximage->blue_mask == 0x0000FF;

  for (int row = 0; row < height; row++) {
    uint8_t* dest = image.pixels.data() + static_cast<size_t>(row) * image.stride;
    if (direct_copy) {
      std::memcpy(dest, ximage->data + static_cast<size_t>(row) * ximage->bytes_per_line,
                  static_cast<size_t>(width) * 4);
      for (int col = 0; col < width; col++) {
        dest[col * 4 + 3] = 0xFF;  // X servers leave the pad byte undefined
      }
      continue;
    }

    for (int col = 0; col < width; col++) {
      unsigned long pixel = XGetPixel(ximage.get(), col, row);
      dest[col * 4 + 0] = static_cast<uint8_t>((pixel & ximage->blue_mask) >> blue_shift);
      dest[col * 4 + 1] = static_cast<uint8_t>((pixel & ximage->green_mask) >> green_shift);
      dest[col * 4 + 2] = static_cast<uint8_t>((pixel & ximage->red_mask) >> red_shift);
      dest[col * 4 + 3] = 0xFF;
    }
  }

  LOG_INFO("ScreenCapture", "Captured " + std::to_string(width) + "x" +
           std::to_string(height) + " from X11 root window");

  result.image = std::move(image);
  result.success = true;
  return result;
}
