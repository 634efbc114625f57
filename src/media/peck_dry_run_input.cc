#include "peck_input_injector.h"
#include "logger.h"

PeckDryRunInputInjector::PeckDryRunInputInjector(const ScreenSize& logical_size)
    : logical_size_(logical_size) {}

InputResult PeckDryRunInputInjector::MoveAndClick(int logical_x, int logical_y,
                                                  int settle_delay_ms) {
  InputResult result;

  ActionPoint point;
  point.logical_x = logical_x;
  point.logical_y = logical_y;
  clicks_.push_back(point);

  LOG_INFO("InputInjector", "[dry-run] would click (" + std::to_string(logical_x) + ", " +
           std::to_string(logical_y) + ") after " + std::to_string(settle_delay_ms) + "ms");

  result.success = true;
  return result;
}
