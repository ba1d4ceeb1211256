#pragma once
#include "su3.hpp"
#include "su3_error.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace su3 {

struct Decoded {
    Package              package;
    std::vector<uint8_t> rest;        // bytes after the signature; not an error
    size_t               signed_len = 0;  // input bytes before the signature
};

// Parse one SU3 record from the front of data.
// Throws su3::Error (MagicMismatch, InsufficientData, UnknownEnumCode) on
// malformed input. A version length below 16 is accepted here.
Decoded decode(const uint8_t* data, size_t len);
Decoded decode(const std::vector<uint8_t>& data);

// 40 + sizes of the four regions.
uint64_t encoded_size(const Package& pkg);

// Serialise pkg. The signature length field is always
// signature_length(pkg.signature_type), whatever raw_signature holds.
// Throws su3::Error (InvalidVersionLength) if raw_version is under 16 bytes.
std::vector<uint8_t> encode(const Package& pkg);

// Serialise into out[0, capacity); returns the number of bytes written.
// Throws su3::Error (InvalidVersionLength, OutputTooSmall) before touching out.
size_t encode_into(const Package& pkg, uint8_t* out, size_t capacity);

} // namespace su3
