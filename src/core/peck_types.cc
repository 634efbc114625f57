#include "peck_types.h"
#include <cstdio>

RasterImage RasterImage::Create(int width, int height) {
  RasterImage image;
  if (width <= 0 || height <= 0) {
    return image;
  }

  image.width = width;
  image.height = height;
  image.stride = width * 4;
  image.pixels.assign(static_cast<size_t>(image.stride) * height, 0);

  // Opaque alpha
  for (size_t i = 3; i < image.pixels.size(); i += 4) {
    image.pixels[i] = 0xFF;
  }
  return image;
}

uint32_t RasterImage::PixelAt(int x, int y) const {
  if (x < 0 || y < 0 || x >= width || y >= height) {
    return 0;
  }
  size_t offset = static_cast<size_t>(y) * stride + static_cast<size_t>(x) * 4;
  return (static_cast<uint32_t>(pixels[offset + 3]) << 24) |
         (static_cast<uint32_t>(pixels[offset + 2]) << 16) |
         (static_cast<uint32_t>(pixels[offset + 1]) << 8) |
         static_cast<uint32_t>(pixels[offset + 0]);
}

std::string CoordinateLabel::ToString() const {
  char buffer[10];
  snprintf(buffer, sizeof(buffer), "%04X,%04X", x, y);
  return std::string(buffer);
}
