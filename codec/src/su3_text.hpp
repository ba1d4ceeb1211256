#pragma once
#include "su3.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace su3 {

// Version string without its trailing NUL padding.
// Throws su3::Error (TextDecode) if raw_version is not valid UTF-8.
std::string version_text(const Package& pkg);

// Throws su3::Error (TextDecode) if raw_signer_id is not valid UTF-8.
std::string signer_id_text(const Package& pkg);

// raw_version for a version string: the UTF-8 bytes, NUL padded up to
// kMinVersionLength. Longer strings are kept whole.
std::vector<uint8_t> pad_version(const std::string& version);

// Offset of the first byte that breaks UTF-8, or data.size() if none does.
size_t utf8_error_offset(const std::vector<uint8_t>& data);

} // namespace su3
