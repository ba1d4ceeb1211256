#include "su3_digest.hpp"
#include "su3_codec.hpp"
#include "su3_text.hpp"
#include "su3_types.hpp"
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

int main() {
    bool ok = true;

    // Known-answer vectors
    const std::vector<uint8_t> abc = {'a', 'b', 'c'};
    ok &= check(su3::to_hex(su3::digest_bytes("SHA1", abc)) ==
                "a9993e364706816aba3e25717850c26c9cd0d89d", "SHA1(abc)");
    ok &= check(su3::to_hex(su3::digest_bytes("SHA256", abc)) ==
                "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "SHA256(abc)");

    su3::Package p;
    p.file_type     = su3::FileType::XmlGz;
    p.content_type  = su3::ContentType::NewsFeed;
    p.raw_version   = su3::pad_version("1442406363");
    const char* signer = "news@mail.i2p";
    p.raw_signer_id.assign(signer, signer + std::strlen(signer));
    p.raw_content.assign(64, 0x42);

    // Signed region is everything but the signature
    struct { su3::SignatureType t; const char* md; size_t md_len; } cases[] = {
        {su3::SignatureType::DsaSha1,              "SHA1",   20},
        {su3::SignatureType::EcdsaSha256P256,      "SHA256", 32},
        {su3::SignatureType::RsaSha2562048,        "SHA256", 32},
        {su3::SignatureType::EcdsaSha384P384,      "SHA384", 48},
        {su3::SignatureType::RsaSha3843072,        "SHA384", 48},
        {su3::SignatureType::EcdsaSha512P521,      "SHA512", 64},
        {su3::SignatureType::RsaSha5124096,        "SHA512", 64},
        {su3::SignatureType::EddsaSha512Ed25519ph, "SHA512", 64},
    };

    for (const auto& c : cases) {
        const std::string label = su3::to_string(c.t);
        p.signature_type = c.t;
        p.raw_signature.assign(su3::signature_length(c.t), 0x99);

        try {
            std::vector<uint8_t> wire = su3::encode(p);
            std::vector<uint8_t> region = su3::signed_region(p);
            ok &= check(region.size() == wire.size() - p.raw_signature.size(),
                        label + ": region size");
            ok &= check(std::equal(region.begin(), region.end(), wire.begin()),
                        label + ": region bytes");

            ok &= check(std::strcmp(su3::digest_name(c.t), c.md) == 0, label + ": digest name");
            std::vector<uint8_t> md = su3::signed_region_digest(p);
            ok &= check(md.size() == c.md_len, label + ": digest size");
            ok &= check(md == su3::digest_bytes(c.md, region), label + ": digest value");
        } catch (const std::exception& e) {
            ok = fail(label + ": threw " + e.what());
        }
    }

    // The signature bytes do not affect the digest
    {
        p.signature_type = su3::SignatureType::EcdsaSha256P256;
        p.raw_signature.assign(64, 0x00);
        std::vector<uint8_t> a = su3::signed_region_digest(p);
        p.raw_signature.assign(64, 0xFF);
        ok &= check(su3::signed_region_digest(p) == a, "digest depends on signature");
    }

    // A file's signed region is its own prefix, unused header bytes included
    {
        p.signature_type = su3::SignatureType::RsaSha2562048;
        p.raw_signature.assign(256, 0x5A);
        std::vector<uint8_t> file = su3::encode(p);
        const size_t prefix = file.size() - p.raw_signature.size();
        file[7]  = 0x01;  // file format version
        file[30] = 0x7E;  // header padding
        file.push_back(0xEE);
        file.push_back(0xEF);

        try {
            su3::Decoded d = su3::decode(file);
            ok &= check(d.signed_len == prefix, "file: signed_len");
            ok &= check(d.package.raw_signature == p.raw_signature, "file: signature");

            std::vector<uint8_t> region = su3::signed_region(file);
            ok &= check(region.size() == prefix, "file: region size");
            ok &= check(std::equal(region.begin(), region.end(), file.begin()),
                        "file: region bytes");
            ok &= check(region[7] == 0x01 && region[30] == 0x7E, "file: unused bytes kept");
            ok &= check(region != su3::signed_region(d.package), "file: region re-encoded");

            const std::vector<uint8_t> want =
                su3::digest_bytes("SHA256", std::vector<uint8_t>(file.begin(),
                                  file.begin() + (std::ptrdiff_t)prefix));
            ok &= check(su3::signed_region_digest(file) == want, "file: digest");
            ok &= check(su3::signed_region_digest(file) != su3::signed_region_digest(d.package),
                        "file: digest matches re-encoded record");
        } catch (const std::exception& e) {
            ok = fail(std::string("file region threw: ") + e.what());
        }

        try {
            su3::signed_region(file.data(), 20);
            ok = fail("signed_region accepted truncated file");
        } catch (const su3::Error& e) {
            ok &= check(e.kind() == su3::ErrorKind::InsufficientData, "truncated file: kind");
        }
    }

    // Same validation as encode()
    {
        su3::Package bad = p;
        bad.raw_version.resize(8);
        try {
            su3::signed_region(bad);
            ok = fail("signed_region accepted short version");
        } catch (const su3::Error& e) {
            ok &= check(e.kind() == su3::ErrorKind::InvalidVersionLength, "short version: kind");
        }
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
