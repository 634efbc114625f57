#ifndef PECK_IMAGE_IO_H_
#define PECK_IMAGE_IO_H_

#include <cstdint>
#include <string>
#include <vector>
#include "peck_types.h"

// PNG encode/decode for RasterImage through Cairo
namespace PeckImageIO {

// Encode to PNG in memory. Returns an empty vector on failure.
std::vector<uint8_t> EncodePNG(const RasterImage& image);

// Write a PNG file. On failure returns false and fills error.
bool SavePNG(const RasterImage& image, const std::string& path, std::string& error);

// Read a PNG file into ARGB32 pixels. On failure returns false and fills error.
bool LoadPNG(const std::string& path, RasterImage& image, std::string& error);

}  // namespace PeckImageIO

#endif  // PECK_IMAGE_IO_H_
