#pragma once
#include "su3.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace su3 {

// True for the gzip file types (XmlGz, TxtGz).
bool is_gzip_file_type(FileType t);

// Payload of pkg: inflated for XmlGz / TxtGz, raw_content as-is otherwise
// (ZIP archives are returned untouched).
// Throws su3::Error (Decompression) on a corrupt or truncated gzip stream.
std::vector<uint8_t> content(const Package& pkg);

// gzip inflate / deflate of a complete in-memory stream. Input of any size is
// handed to zlib at most `slice` bytes at a time (0 or anything above
// UINT_MAX means UINT_MAX, the most one zlib call accepts).
std::vector<uint8_t> gunzip_bytes(const std::vector<uint8_t>& gz);
std::vector<uint8_t> gunzip_bytes(const std::vector<uint8_t>& gz, size_t slice);
std::vector<uint8_t> gzip_bytes(const std::vector<uint8_t>& data);
std::vector<uint8_t> gzip_bytes(const std::vector<uint8_t>& data, size_t slice);

} // namespace su3
