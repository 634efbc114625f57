#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace PeckEncoding {

// Standard base64 with '=' padding
std::string Base64Encode(const std::vector<uint8_t>& data);

}  // namespace PeckEncoding
