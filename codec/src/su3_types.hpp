#pragma once
#include "su3.hpp"
#include <string>
#include <cstdint>

namespace su3 {

// Wire code -> enum. Throws su3::Error (UnknownEnumCode) for codes outside
// the closed set, e.g. signature type 7.
SignatureType signature_type_from_code(uint16_t code);
FileType      file_type_from_code(uint8_t code);
ContentType   content_type_from_code(uint8_t code);

// Names used by manifests and summaries:
//   signature: "DSA_SHA1", "ECDSA_SHA256_P256", ..., "EdDSA_SHA512_Ed25519ph"
//   file:      "zip", "xml", "html", "xml.gz", "txt.gz", "dmg", "exe"
//   content:   "unknown", "router", "plugin", "reseed", "news", "blocklist"
std::string to_string(SignatureType t);
std::string to_string(FileType t);
std::string to_string(ContentType t);

// Case-insensitive; throws std::runtime_error on an unknown name.
SignatureType signature_type_from_name(const std::string& name);
FileType      file_type_from_name(const std::string& name);
ContentType   content_type_from_name(const std::string& name);

} // namespace su3
