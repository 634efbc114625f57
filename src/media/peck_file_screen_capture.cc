#include "peck_screen_capture.h"
#include "peck_image_io.h"
#include "logger.h"

PeckFileScreenCapture::PeckFileScreenCapture(const std::string& png_path)
    : png_path_(png_path) {}

CaptureResult PeckFileScreenCapture::Capture() {
  CaptureResult result;

  std::string error;
  if (!PeckImageIO::LoadPNG(png_path_, result.image, error)) {
    result.error = "Failed to load screenshot: " + error;
    LOG_ERROR("ScreenCapture", result.error);
    return result;
  }

  LOG_INFO("ScreenCapture", "Loaded " + std::to_string(result.image.width) + "x" +
           std::to_string(result.image.height) + " screenshot from " + png_path_);
  result.success = true;
  return result;
}
