#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// SU3 signed package (I2P router updates, reseed bundles, news feeds).
//
// Offset  Size  Field
// ------  ----  -----
//  0       6    Magic: "I2Psu3"
//  6       1    unused (0)
//  7       1    format version (ignored)
//  8       2    signature type
// 10       2    signature length
// 12       1    unused
// 13       1    version length (>= 16)
// 14       1    unused
// 15       1    signer id length
// 16       8    content length
// 24       1    unused
// 25       1    file type
// 26       1    unused
// 27       1    content type
// 28      12    unused (0)
// 40       V    version (UTF-8, NUL padded)
//          S    signer id (UTF-8)
//          C    content
//          G    signature over bytes [0, end of content)
//
// All integers are big-endian.

namespace su3 {

static constexpr char   kMagic[]           = "I2Psu3";
static constexpr size_t kMagicLen          = 6;
static constexpr size_t kHeaderSize        = 40;
static constexpr size_t kMinVersionLength  = 16;

enum class SignatureType : uint16_t {
    DsaSha1              = 0x0000,
    EcdsaSha256P256      = 0x0001,
    EcdsaSha384P384      = 0x0002,
    EcdsaSha512P521      = 0x0003,
    RsaSha2562048        = 0x0004,
    RsaSha3843072        = 0x0005,
    RsaSha5124096        = 0x0006,
    EddsaSha512Ed25519ph = 0x0008,
};

enum class FileType : uint8_t {
    Zip   = 0x00,
    Xml   = 0x01,
    Html  = 0x02,
    XmlGz = 0x03,
    TxtGz = 0x04,
    Dmg   = 0x05,
    Exe   = 0x06,
};

enum class ContentType : uint8_t {
    Unknown       = 0x00,
    RouterUpdate  = 0x01,
    Plugin        = 0x02,
    ReseedData    = 0x03,
    NewsFeed      = 0x04,
    BlocklistFeed = 0x05,
};

// Signature byte size for each algorithm (I2P common structures):
//   DSA-SHA1:            40
//   ECDSA P-256, EdDSA:  64
//   ECDSA P-384:         96
//   ECDSA P-521:        132
//   RSA 2048/3072/4096: 256/384/512
inline uint16_t signature_length(SignatureType t) {
    switch (t) {
        case SignatureType::DsaSha1:              return 40;
        case SignatureType::EcdsaSha256P256:
        case SignatureType::EddsaSha512Ed25519ph: return 64;
        case SignatureType::EcdsaSha384P384:      return 96;
        case SignatureType::EcdsaSha512P521:      return 132;
        case SignatureType::RsaSha2562048:        return 256;
        case SignatureType::RsaSha3843072:        return 384;
        case SignatureType::RsaSha5124096:        return 512;
    }
    return 0;
}

// Decoded form of one SU3 file. Each region owns a copy of its bytes; the
// length fields of the header are derived from the region sizes on encode.
struct Package {
    SignatureType signature_type = SignatureType::DsaSha1;
    FileType      file_type      = FileType::Zip;
    ContentType   content_type   = ContentType::Unknown;
    std::vector<uint8_t> raw_version;    // >= 16 bytes, NUL padded
    std::vector<uint8_t> raw_signer_id;  // e.g. "zzz@mail.i2p"
    std::vector<uint8_t> raw_content;    // possibly gzip, see su3_content.hpp
    std::vector<uint8_t> raw_signature;  // signature_length(signature_type) bytes
};

inline bool operator==(const Package& a, const Package& b) {
    return a.signature_type == b.signature_type &&
           a.file_type      == b.file_type      &&
           a.content_type   == b.content_type   &&
           a.raw_version    == b.raw_version    &&
           a.raw_signer_id  == b.raw_signer_id  &&
           a.raw_content    == b.raw_content    &&
           a.raw_signature  == b.raw_signature;
}

inline bool operator!=(const Package& a, const Package& b) {
    return !(a == b);
}

} // namespace su3
