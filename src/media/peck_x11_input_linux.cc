#include "peck_input_injector.h"
#include "logger.h"

#include <X11/Xlib.h>
#include <cstring>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace {

struct DisplayDeleter {
  void operator()(Display* display) {
    if (display) XCloseDisplay(display);
  }
};
using DisplayPtr = std::unique_ptr<Display, DisplayDeleter>;

// Deepest mapped window under the pointer, or root if none
Window FindWindowUnderPointer(Display* display, Window root) {
  Window target = root;
  Window current = root;

  while (true) {
    Window root_return, child_return;
    int root_x, root_y, win_x, win_y;
    unsigned int mask;
    if (!XQueryPointer(display, current, &root_return, &child_return,
                       &root_x, &root_y, &win_x, &win_y, &mask)) {
      break;
    }
    if (child_return == None) {
      break;
    }
    target = child_return;
    current = child_return;
  }
  return target;
}

}  // namespace

PeckX11InputInjector::PeckX11InputInjector(const std::string& display_name)
    : display_name_(display_name) {}

ScreenSize PeckX11InputInjector::LogicalScreenSize() {
  ScreenSize size;
  DisplayPtr display(XOpenDisplay(display_name_.empty() ? nullptr : display_name_.c_str()));
  if (!display) {
    LOG_ERROR("InputInjector", "Failed to connect to X server");
    return size;
  }

  int screen = DefaultScreen(display.get());
  size.width = DisplayWidth(display.get(), screen);
  size.height = DisplayHeight(display.get(), screen);
  return size;
}

InputResult PeckX11InputInjector::MoveAndClick(int logical_x, int logical_y, int settle_delay_ms) {
  InputResult result;

  DisplayPtr display(XOpenDisplay(display_name_.empty() ? nullptr : display_name_.c_str()));
  if (!display) {
    result.error = "Failed to connect to X server" +
                   (display_name_.empty() ? std::string() : " on display " + display_name_);
    LOG_ERROR("InputInjector", result.error);
    return result;
  }

  Window root = XDefaultRootWindow(display.get());

  XWarpPointer(display.get(), None, root, 0, 0, 0, 0, logical_x, logical_y);
  XFlush(display.get());

  if (settle_delay_ms > 0) {
    usleep(static_cast<useconds_t>(settle_delay_ms) * 1000);
  }

  Window target_window = FindWindowUnderPointer(display.get(), root);

  int win_x = logical_x;
  int win_y = logical_y;
  Window child;
  if (!XTranslateCoordinates(display.get(), root, target_window, logical_x, logical_y,
                             &win_x, &win_y, &child)) {
    result.error = "Failed to translate click point into target window";
    LOG_ERROR("InputInjector", result.error);
    return result;
  }

  XEvent event;
  memset(&event, 0, sizeof(event));

  event.xbutton.display     = display.get();
  event.xbutton.window      = target_window;
  event.xbutton.root        = root;
  event.xbutton.subwindow   = None;
  event.xbutton.time        = CurrentTime;
  event.xbutton.x           = win_x;
  event.xbutton.y           = win_y;
  event.xbutton.x_root      = logical_x;
  event.xbutton.y_root      = logical_y;
  event.xbutton.same_screen = True;
  event.xbutton.button      = Button1;

  event.type = ButtonPress;
  if (!XSendEvent(display.get(), target_window, True, ButtonPressMask, &event)) {
    result.error = "XSendEvent(ButtonPress) failed";
    LOG_ERROR("InputInjector", result.error);
    return result;
  }
  XFlush(display.get());
  usleep(30000);

  event.type = ButtonRelease;
  event.xbutton.state = Button1Mask;
  if (!XSendEvent(display.get(), target_window, True, ButtonReleaseMask, &event)) {
    result.error = "XSendEvent(ButtonRelease) failed";
    LOG_ERROR("InputInjector", result.error);
    return result;
  }
  XFlush(display.get());

  std::ostringstream window_id;
  window_id << "0x" << std::hex << target_window;
  LOG_INFO("InputInjector", "Clicked (" + std::to_string(logical_x) + ", " +
           std::to_string(logical_y) + ") on window " + window_id.str());

  result.success = true;
  return result;
}
