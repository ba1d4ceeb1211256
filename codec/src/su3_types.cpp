#include "su3_types.hpp"
#include "su3_error.hpp"
#include <cctype>
#include <stdexcept>
#include <string>

namespace su3 {

// ── Wire codes ────────────────────────────────────────────────────────────────

SignatureType signature_type_from_code(uint16_t code) {
    switch (code) {
        case 0x0000: return SignatureType::DsaSha1;
        case 0x0001: return SignatureType::EcdsaSha256P256;
        case 0x0002: return SignatureType::EcdsaSha384P384;
        case 0x0003: return SignatureType::EcdsaSha512P521;
        case 0x0004: return SignatureType::RsaSha2562048;
        case 0x0005: return SignatureType::RsaSha3843072;
        case 0x0006: return SignatureType::RsaSha5124096;
        case 0x0008: return SignatureType::EddsaSha512Ed25519ph;
        default: throw Error::unknown_enum_code(EnumField::SignatureType, code);
    }
}

FileType file_type_from_code(uint8_t code) {
    switch (code) {
        case 0x00: return FileType::Zip;
        case 0x01: return FileType::Xml;
        case 0x02: return FileType::Html;
        case 0x03: return FileType::XmlGz;
        case 0x04: return FileType::TxtGz;
        case 0x05: return FileType::Dmg;
        case 0x06: return FileType::Exe;
        default: throw Error::unknown_enum_code(EnumField::FileType, code);
    }
}

ContentType content_type_from_code(uint8_t code) {
    switch (code) {
        case 0x00: return ContentType::Unknown;
        case 0x01: return ContentType::RouterUpdate;
        case 0x02: return ContentType::Plugin;
        case 0x03: return ContentType::ReseedData;
        case 0x04: return ContentType::NewsFeed;
        case 0x05: return ContentType::BlocklistFeed;
        default: throw Error::unknown_enum_code(EnumField::ContentType, code);
    }
}

// ── Names ─────────────────────────────────────────────────────────────────────

std::string to_string(SignatureType t) {
    switch (t) {
        case SignatureType::DsaSha1:              return "DSA_SHA1";
        case SignatureType::EcdsaSha256P256:      return "ECDSA_SHA256_P256";
        case SignatureType::EcdsaSha384P384:      return "ECDSA_SHA384_P384";
        case SignatureType::EcdsaSha512P521:      return "ECDSA_SHA512_P521";
        case SignatureType::RsaSha2562048:        return "RSA_SHA256_2048";
        case SignatureType::RsaSha3843072:        return "RSA_SHA384_3072";
        case SignatureType::RsaSha5124096:        return "RSA_SHA512_4096";
        case SignatureType::EddsaSha512Ed25519ph: return "EdDSA_SHA512_Ed25519ph";
    }
    return "unknown";
}

std::string to_string(FileType t) {
    switch (t) {
        case FileType::Zip:   return "zip";
        case FileType::Xml:   return "xml";
        case FileType::Html:  return "html";
        case FileType::XmlGz: return "xml.gz";
        case FileType::TxtGz: return "txt.gz";
        case FileType::Dmg:   return "dmg";
        case FileType::Exe:   return "exe";
    }
    return "unknown";
}

std::string to_string(ContentType t) {
    switch (t) {
        case ContentType::Unknown:       return "unknown";
        case ContentType::RouterUpdate:  return "router";
        case ContentType::Plugin:        return "plugin";
        case ContentType::ReseedData:    return "reseed";
        case ContentType::NewsFeed:      return "news";
        case ContentType::BlocklistFeed: return "blocklist";
    }
    return "unknown";
}

static std::string lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out += (char)std::tolower(c);
    return out;
}

SignatureType signature_type_from_name(const std::string& name) {
    const std::string n = lower(name);
    if (n == "dsa_sha1")               return SignatureType::DsaSha1;
    if (n == "ecdsa_sha256_p256")      return SignatureType::EcdsaSha256P256;
    if (n == "ecdsa_sha384_p384")      return SignatureType::EcdsaSha384P384;
    if (n == "ecdsa_sha512_p521")      return SignatureType::EcdsaSha512P521;
    if (n == "rsa_sha256_2048")        return SignatureType::RsaSha2562048;
    if (n == "rsa_sha384_3072")        return SignatureType::RsaSha3843072;
    if (n == "rsa_sha512_4096")        return SignatureType::RsaSha5124096;
    if (n == "eddsa_sha512_ed25519ph") return SignatureType::EddsaSha512Ed25519ph;
    throw std::runtime_error("Unknown signature type: " + name);
}

FileType file_type_from_name(const std::string& name) {
    const std::string n = lower(name);
    if (n == "zip")    return FileType::Zip;
    if (n == "xml")    return FileType::Xml;
    if (n == "html")   return FileType::Html;
    if (n == "xml.gz") return FileType::XmlGz;
    if (n == "txt.gz") return FileType::TxtGz;
    if (n == "dmg")    return FileType::Dmg;
    if (n == "exe")    return FileType::Exe;
    throw std::runtime_error("Unknown file type: " + name);
}

ContentType content_type_from_name(const std::string& name) {
    const std::string n = lower(name);
    if (n == "unknown")   return ContentType::Unknown;
    if (n == "router")    return ContentType::RouterUpdate;
    if (n == "plugin")    return ContentType::Plugin;
    if (n == "reseed")    return ContentType::ReseedData;
    if (n == "news")      return ContentType::NewsFeed;
    if (n == "blocklist") return ContentType::BlocklistFeed;
    throw std::runtime_error("Unknown content type: " + name);
}

} // namespace su3
