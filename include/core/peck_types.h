#ifndef PECK_TYPES_H_
#define PECK_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>

// Raster image in Cairo ARGB32 layout (B G R A per pixel on little-endian),
// sized in physical pixels. Used both for the raw capture and for the
// overlay image derived from it.
struct RasterImage {
  int width = 0;
  int height = 0;
  int stride = 0;  // Bytes per row, always >= width * 4
  std::vector<uint8_t> pixels;

  bool IsValid() const {
    return width > 0 && height > 0 && stride >= width * 4 &&
           pixels.size() >= static_cast<size_t>(stride) * height;
  }

  // Allocate an opaque black image
  static RasterImage Create(int width, int height);

  // Read one pixel as 0xAARRGGBB
  uint32_t PixelAt(int x, int y) const;
};

using CaptureImage = RasterImage;
using GridOverlayImage = RasterImage;

struct GridSpec {
  int cell_size_px = 40;

  bool IsValid() const { return cell_size_px > 0 && cell_size_px <= 0xFFFF; }
};

// One cell of the grid, identified by column/row. Origins are physical pixels.
struct GridCell {
  int column = 0;
  int row = 0;
  int origin_x = 0;
  int origin_y = 0;
  int width = 0;   // Edge cells may be narrower than the cell size
  int height = 0;  // Edge cells may be shorter than the cell size
};

struct GridLayout {
  int columns = 0;
  int rows = 0;
  int cell_size_px = 0;
  int image_width = 0;
  int image_height = 0;

  int CellCount() const { return columns * rows; }
};

// Decoded "XXXX,YYYY" label: a cell origin in physical pixels
struct CoordinateLabel {
  uint16_t x = 0;
  uint16_t y = 0;

  std::string ToString() const;

  bool operator==(const CoordinateLabel& other) const {
    return x == other.x && y == other.y;
  }
  bool operator!=(const CoordinateLabel& other) const { return !(*this == other); }
};

// Cell center in physical pixels
struct TargetPoint {
  int physical_x = 0;
  int physical_y = 0;
};

// Point handed to the input injector, in logical (DPI-independent) pixels
struct ActionPoint {
  int logical_x = 0;
  int logical_y = 0;
};

struct ScreenSize {
  int width = 0;
  int height = 0;

  bool IsValid() const { return width > 0 && height > 0; }
};

#endif  // PECK_TYPES_H_
