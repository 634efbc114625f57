#include "peck_coordinate_transform.h"
#include "logger.h"
#include <algorithm>
#include <cmath>

TargetPoint PeckCoordinateTransform::ToTargetPoint(int origin_x, int origin_y,
                                                   const ScreenSize& physical) const {
  TargetPoint point;
  int half = spec_.cell_size_px / 2;

  // Edge cells can be smaller than cell_size, so the nominal center may
  // lie past the border
  point.physical_x = std::clamp(origin_x + half, 0, std::max(0, physical.width - 1));
  point.physical_y = std::clamp(origin_y + half, 0, std::max(0, physical.height - 1));
  return point;
}

PeckCoordinateTransform::TransformResult PeckCoordinateTransform::ToActionPoint(
    int origin_x, int origin_y,
    const ScreenSize& physical,
    const ScreenSize& logical) const {
  TransformResult result;

  if (!physical.IsValid()) {
    result.error = "Invalid capture size " + std::to_string(physical.width) + "x" +
                   std::to_string(physical.height);
    return result;
  }
  if (!logical.IsValid()) {
    result.error = "Invalid logical screen size " + std::to_string(logical.width) + "x" +
                   std::to_string(logical.height);
    return result;
  }

  result.target = ToTargetPoint(origin_x, origin_y, physical);

  result.scale_x = static_cast<double>(logical.width) / physical.width;
  result.scale_y = static_cast<double>(logical.height) / physical.height;

  double scaled_x = std::floor(result.target.physical_x * result.scale_x);
  double scaled_y = std::floor(result.target.physical_y * result.scale_y);

  if (scaled_x < 0 || scaled_y < 0 || scaled_x > logical.width || scaled_y > logical.height) {
    result.error = "Scaled point (" + std::to_string(static_cast<long>(scaled_x)) + ", " +
                   std::to_string(static_cast<long>(scaled_y)) + ") outside logical screen " +
                   std::to_string(logical.width) + "x" + std::to_string(logical.height);
    return result;
  }

  result.action.logical_x = static_cast<int>(scaled_x);
  result.action.logical_y = static_cast<int>(scaled_y);
  result.success = true;

  LOG_DEBUG("CoordinateTransform", "Origin (" + std::to_string(origin_x) + ", " +
            std::to_string(origin_y) + ") -> center (" +
            std::to_string(result.target.physical_x) + ", " +
            std::to_string(result.target.physical_y) + ") -> click (" +
            std::to_string(result.action.logical_x) + ", " +
            std::to_string(result.action.logical_y) + ")");

  return result;
}
