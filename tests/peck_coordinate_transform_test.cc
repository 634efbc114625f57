#include <gtest/gtest.h>
#include "peck_coordinate_transform.h"

namespace {

ScreenSize Size(int width, int height) {
  ScreenSize size;
  size.width = width;
  size.height = height;
  return size;
}

GridSpec Spec(int cell) {
  GridSpec spec;
  spec.cell_size_px = cell;
  return spec;
}

}  // namespace

TEST(CoordinateTransform, HighDpiDisplayScalesDown) {
  PeckCoordinateTransform transform(Spec(40));
  PeckCoordinateTransform::TransformResult result =
      transform.ToActionPoint(640, 480, Size(2560, 1440), Size(1280, 720));

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.target.physical_x, 660);
  EXPECT_EQ(result.target.physical_y, 500);
  EXPECT_EQ(result.action.logical_x, 330);
  EXPECT_EQ(result.action.logical_y, 250);
  EXPECT_DOUBLE_EQ(result.scale_x, 0.5);
  EXPECT_DOUBLE_EQ(result.scale_y, 0.5);
}

TEST(CoordinateTransform, IdentityScale) {
  PeckCoordinateTransform transform(Spec(40));
  PeckCoordinateTransform::TransformResult result =
      transform.ToActionPoint(640, 320, Size(1920, 1080), Size(1920, 1080));

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.action.logical_x, 660);
  EXPECT_EQ(result.action.logical_y, 340);
}

TEST(CoordinateTransform, AxesScaleIndependently) {
  PeckCoordinateTransform transform(Spec(40));
  PeckCoordinateTransform::TransformResult result =
      transform.ToActionPoint(0, 0, Size(2000, 1000), Size(1000, 1000));

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.action.logical_x, 10);
  EXPECT_EQ(result.action.logical_y, 20);
}

TEST(CoordinateTransform, FractionalScaleTruncates) {
  PeckCoordinateTransform transform(Spec(40));
  // 1.5x display: center 20 * (2/3) = 13.33
  PeckCoordinateTransform::TransformResult result =
      transform.ToActionPoint(0, 0, Size(2880, 1620), Size(1920, 1080));

  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.action.logical_x, 13);
  EXPECT_EQ(result.action.logical_y, 13);
}

TEST(CoordinateTransform, LastPartialCellCenterIsClamped) {
  PeckCoordinateTransform transform(Spec(40));
  // 1910x1075: last column starts at 1880 and is 30px wide, last row at 1040 and 35px tall
  TargetPoint point = transform.ToTargetPoint(1880, 1040, Size(1910, 1075));
  EXPECT_EQ(point.physical_x, 1900);
  EXPECT_EQ(point.physical_y, 1060);

  // 1890x1045: last column 10px wide, last row 5px tall
  point = transform.ToTargetPoint(1880, 1040, Size(1890, 1045));
  EXPECT_EQ(point.physical_x, 1889);
  EXPECT_EQ(point.physical_y, 1044);
}

TEST(CoordinateTransform, CaptureSmallerThanOneCell) {
  PeckCoordinateTransform transform(Spec(40));
  TargetPoint point = transform.ToTargetPoint(0, 0, Size(12, 8));
  EXPECT_EQ(point.physical_x, 11);
  EXPECT_EQ(point.physical_y, 7);
}

TEST(CoordinateTransform, NeverNegative) {
  PeckCoordinateTransform transform(Spec(1));
  TargetPoint point = transform.ToTargetPoint(0, 0, Size(1, 1));
  EXPECT_EQ(point.physical_x, 0);
  EXPECT_EQ(point.physical_y, 0);
}

TEST(CoordinateTransform, RejectsEmptySizes) {
  PeckCoordinateTransform transform(Spec(40));
  EXPECT_FALSE(transform.ToActionPoint(0, 0, Size(0, 1080), Size(1920, 1080)).success);
  EXPECT_FALSE(transform.ToActionPoint(0, 0, Size(1920, 1080), Size(1920, 0)).success);
}
