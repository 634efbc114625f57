#include "peck_encoding_utils.h"

namespace PeckEncoding {

std::string Base64Encode(const std::vector<uint8_t>& data) {
  static const char base64_chars[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                      (static_cast<uint32_t>(data[i + 1]) << 8) |
                      static_cast<uint32_t>(data[i + 2]);
    encoded += base64_chars[(triple >> 18) & 0x3f];
    encoded += base64_chars[(triple >> 12) & 0x3f];
    encoded += base64_chars[(triple >> 6) & 0x3f];
    encoded += base64_chars[triple & 0x3f];
  }

  size_t remaining = data.size() - i;
  if (remaining > 0) {
    uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
    if (remaining == 2) {
      triple |= static_cast<uint32_t>(data[i + 1]) << 8;
    }
    encoded += base64_chars[(triple >> 18) & 0x3f];
    encoded += base64_chars[(triple >> 12) & 0x3f];
    encoded += remaining == 2 ? base64_chars[(triple >> 6) & 0x3f] : '=';
    encoded += '=';
  }

  return encoded;
}

}  // namespace PeckEncoding
