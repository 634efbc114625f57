#ifndef PECK_SCREEN_CAPTURE_H_
#define PECK_SCREEN_CAPTURE_H_

#include <string>
#include "peck_capabilities.h"

// Captures the X11 root window, which spans every attached monitor
class PeckX11ScreenCapture : public IScreenCapture {
 public:
  // Empty display name uses $DISPLAY
  explicit PeckX11ScreenCapture(const std::string& display_name = "");

  std::string GetName() const override { return "x11"; }
  CaptureResult Capture() override;

 private:
  std::string display_name_;
};

// Serves a saved PNG screenshot as the capture
class PeckFileScreenCapture : public IScreenCapture {
 public:
  explicit PeckFileScreenCapture(const std::string& png_path);

  std::string GetName() const override { return "file:" + png_path_; }
  CaptureResult Capture() override;

 private:
  std::string png_path_;
};

#endif  // PECK_SCREEN_CAPTURE_H_
