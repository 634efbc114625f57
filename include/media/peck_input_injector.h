#ifndef PECK_INPUT_INJECTOR_H_
#define PECK_INPUT_INJECTOR_H_

#include <string>
#include <vector>
#include "peck_capabilities.h"

// Pointer warp plus synthetic ButtonPress/ButtonRelease on the X11 window
// under the pointer. X11 core coordinates are device pixels, so the logical
// screen size equals the root window size.
class PeckX11InputInjector : public IInputInjector {
 public:
  explicit PeckX11InputInjector(const std::string& display_name = "");

  std::string GetName() const override { return "x11"; }
  ScreenSize LogicalScreenSize() override;
  InputResult MoveAndClick(int logical_x, int logical_y, int settle_delay_ms) override;

 private:
  std::string display_name_;
};

// Logs and records clicks without touching the display
class PeckDryRunInputInjector : public IInputInjector {
 public:
  explicit PeckDryRunInputInjector(const ScreenSize& logical_size);

  std::string GetName() const override { return "dry-run"; }
  ScreenSize LogicalScreenSize() override { return logical_size_; }
  InputResult MoveAndClick(int logical_x, int logical_y, int settle_delay_ms) override;

  const std::vector<ActionPoint>& GetClicks() const { return clicks_; }

 private:
  ScreenSize logical_size_;
  std::vector<ActionPoint> clicks_;
};

#endif  // PECK_INPUT_INJECTOR_H_
