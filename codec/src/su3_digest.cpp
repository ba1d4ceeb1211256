#include "su3_digest.hpp"
#include "su3_codec.hpp"
#include <openssl/evp.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace su3 {

std::vector<uint8_t> signed_region(const uint8_t* data, size_t len) {
    const Decoded d = decode(data, len);
    return std::vector<uint8_t>(data, data + d.signed_len);
}

std::vector<uint8_t> signed_region(const std::vector<uint8_t>& data) {
    return signed_region(data.data(), data.size());
}

std::vector<uint8_t> signed_region(const Package& pkg) {
    std::vector<uint8_t> wire = encode(pkg);
    wire.resize(wire.size() - pkg.raw_signature.size());
    return wire;
}

const char* digest_name(SignatureType t) {
    switch (t) {
        case SignatureType::DsaSha1:              return "SHA1";
        case SignatureType::EcdsaSha256P256:
        case SignatureType::RsaSha2562048:        return "SHA256";
        case SignatureType::EcdsaSha384P384:
        case SignatureType::RsaSha3843072:        return "SHA384";
        case SignatureType::EcdsaSha512P521:
        case SignatureType::RsaSha5124096:
        case SignatureType::EddsaSha512Ed25519ph: return "SHA512";
    }
    throw std::invalid_argument("digest_name: unknown signature type");
}

std::vector<uint8_t> digest_bytes(const char* md_name, const std::vector<uint8_t>& data) {
    const EVP_MD* md = EVP_get_digestbyname(md_name);
    if (!md)
        throw std::runtime_error(std::string("digest: unknown algorithm ") + md_name);

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        throw std::runtime_error("digest: EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("digest: DigestInit/Update failed");
    }

    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("digest: DigestFinal failed");
    }
    EVP_MD_CTX_free(ctx);

    out.resize(out_len);
    return out;
}

std::vector<uint8_t> signed_region_digest(const Package& pkg) {
    return digest_bytes(digest_name(pkg.signature_type), signed_region(pkg));
}

std::vector<uint8_t> signed_region_digest(const std::vector<uint8_t>& data) {
    const Decoded d = decode(data);
    const std::vector<uint8_t> region(data.begin(), data.begin() + (std::ptrdiff_t)d.signed_len);
    return digest_bytes(digest_name(d.package.signature_type), region);
}

std::string to_hex(const std::vector<uint8_t>& data) {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += kHex[b >> 4];
        out += kHex[b & 0x0F];
    }
    return out;
}

} // namespace su3
