#ifndef PECK_COORDINATE_TRANSFORM_H_
#define PECK_COORDINATE_TRANSFORM_H_

#include <string>
#include "peck_types.h"

// Maps a decoded cell origin to the point handed to the input injector.
//
//   origin --(+cell/2, clamp to capture)--> TargetPoint (physical)
//          --(x * logicalW/physicalW, y * logicalH/physicalH)--> ActionPoint (logical)
//
// The two axis ratios are applied independently.
class PeckCoordinateTransform {
 public:
  struct TransformResult {
    bool success = false;
    TargetPoint target;
    ActionPoint action;
    double scale_x = 0.0;
    double scale_y = 0.0;
    std::string error;
  };

  explicit PeckCoordinateTransform(const GridSpec& spec) : spec_(spec) {}

  // Cell center clamped to [0, width-1] x [0, height-1]
  TargetPoint ToTargetPoint(int origin_x, int origin_y, const ScreenSize& physical) const;

  // Full chain. Fails when either size is empty or when the scaled point
  // lands outside [0, logicalW] x [0, logicalH].
  TransformResult ToActionPoint(int origin_x, int origin_y,
                                const ScreenSize& physical,
                                const ScreenSize& logical) const;

 private:
  GridSpec spec_;
};

#endif  // PECK_COORDINATE_TRANSFORM_H_
