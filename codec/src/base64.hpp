#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace su3 {

// RFC 4648 alphabet with '=' padding.
std::string base64_encode(const std::vector<uint8_t>& data);

// Whitespace is skipped, so wrapped YAML block scalars decode directly.
// Throws std::invalid_argument on characters outside the alphabet.
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace su3
