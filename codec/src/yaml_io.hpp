#pragma once
#include "su3.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace su3 {

// Build description for a package, read from YAML:
//
//   signature-type: RSA_SHA512_4096   # name or numeric code
//   file-type: zip
//   content-type: reseed
//   version: "1474843282"
//   signer-id: meeh@mail.i2p
//   signature: <base64>               # optional
//
// version and signer-id are required; the type keys default to
// DSA_SHA1 / zip / unknown.
struct Manifest {
    SignatureType        signature_type = SignatureType::DsaSha1;
    FileType             file_type      = FileType::Zip;
    ContentType          content_type   = ContentType::Unknown;
    std::string          version;
    std::string          signer_id;
    std::vector<uint8_t> signature;
};

// Throw std::runtime_error (or YAML::Exception) on a bad manifest.
Manifest parse_manifest(const std::string& yaml_text);
Manifest load_manifest(const std::string& path);

// Package with the manifest's types, the padded version, the signer id,
// the given content and the manifest's signature bytes (possibly empty).
Package make_package(const Manifest& m, const std::vector<uint8_t>& content);

// Human-readable YAML summary of a decoded package. The signature is
// emitted as base64, wrapped at 64 columns.
std::string emit_package_yaml(const Package& pkg);

} // namespace su3
