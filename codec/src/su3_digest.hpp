#pragma once
#include "su3.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace su3 {

// Bytes the signature of an existing record covers: data[0, signed_len), taken
// from the input as-is, unused header bytes included. Throws su3::Error like
// decode().
std::vector<uint8_t> signed_region(const uint8_t* data, size_t len);
std::vector<uint8_t> signed_region(const std::vector<uint8_t>& data);

// Signed bytes of the record encode(pkg) would write; for building a record
// to be signed. Throws su3::Error (InvalidVersionLength) like encode().
std::vector<uint8_t> signed_region(const Package& pkg);

// Digest paired with each signature type:
//   DSA-SHA1                          SHA-1
//   ECDSA P-256, RSA-2048             SHA-256
//   ECDSA P-384, RSA-3072             SHA-384
//   ECDSA P-521, RSA-4096, EdDSA-ph   SHA-512
// Returns the OpenSSL digest name ("SHA1", "SHA256", ...).
const char* digest_name(SignatureType t);

// Hash of signed_region(pkg) with digest_name(pkg.signature_type).
// Input for an external signer; nothing is verified here.
std::vector<uint8_t> signed_region_digest(const Package& pkg);

// Hash of the signed prefix of an encoded record, with the digest its
// signature type pairs with. This is what a verifier of that file checks.
std::vector<uint8_t> signed_region_digest(const std::vector<uint8_t>& data);

// Hash of an arbitrary buffer with the named OpenSSL digest.
std::vector<uint8_t> digest_bytes(const char* md_name, const std::vector<uint8_t>& data);

std::string to_hex(const std::vector<uint8_t>& data);

} // namespace su3
