#include "su3_codec.hpp"
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

static void push_be(std::vector<uint8_t>& buf, uint64_t v, int bytes) {
    for (int i = bytes - 1; i >= 0; --i)
        buf.push_back((uint8_t)((v >> (i * 8)) & 0xFF));
}

// Hand-built SU3 record; independent of the encoder.
static std::vector<uint8_t> build_raw(uint16_t sig_code, uint16_t sig_len,
                                      const std::vector<uint8_t>& version,
                                      const std::string& signer,
                                      const std::vector<uint8_t>& content,
                                      uint8_t file_code, uint8_t content_code)
{
    std::vector<uint8_t> b = {'I', '2', 'P', 's', 'u', '3', 0x00, 0x00};
    push_be(b, sig_code, 2);
    push_be(b, sig_len, 2);
    b.push_back(0x00);
    b.push_back((uint8_t)version.size());
    b.push_back(0x00);
    b.push_back((uint8_t)signer.size());
    push_be(b, content.size(), 8);
    b.push_back(0x00);
    b.push_back(file_code);
    b.push_back(0x00);
    b.push_back(content_code);
    b.insert(b.end(), 12, 0x00);
    b.insert(b.end(), version.begin(), version.end());
    b.insert(b.end(), signer.begin(), signer.end());
    b.insert(b.end(), content.begin(), content.end());
    for (uint16_t i = 0; i < sig_len; ++i)
        b.push_back((uint8_t)(0xA0 + i));
    return b;
}

// Runs decode and returns the error kind; fails the test if decode succeeds.
static bool expect_error(const std::vector<uint8_t>& wire, size_t len,
                         su3::ErrorKind kind, const std::string& what,
                         su3::Error* out = nullptr)
{
    try {
        su3::decode(wire.data(), len);
    } catch (const su3::Error& e) {
        if (out) *out = e;
        return check(e.kind() == kind, what + ": wrong kind (" +
                     su3::to_string(e.kind()) + ")");
    }
    return fail(what + ": decode succeeded");
}

int main() {
    bool ok = true;

    std::vector<uint8_t> version(16, 0x00);
    version[0] = '0'; version[1] = '.'; version[2] = '9'; version[3] = '.';
    version[4] = '6'; version[5] = '6';
    const std::vector<uint8_t> content = {'P', 'K', 0x03, 0x04, 1, 2, 3, 4, 5, 6};

    // Test 1: valid record decodes field by field
    const std::vector<uint8_t> wire =
        build_raw(0x0001, 64, version, "test@mail.i2p", content, 0x00, 0x04);
    ok &= check(wire.size() == 40 + 16 + 13 + 10 + 64, "fixture size");
    try {
        su3::Decoded d = su3::decode(wire);
        const su3::Package& p = d.package;
        ok &= check(p.signature_type == su3::SignatureType::EcdsaSha256P256, "signature type");
        ok &= check(p.file_type == su3::FileType::Zip, "file type");
        ok &= check(p.content_type == su3::ContentType::NewsFeed, "content type");
        ok &= check(p.raw_version == version, "raw_version");
        ok &= check(std::string(p.raw_signer_id.begin(), p.raw_signer_id.end()) ==
                    "test@mail.i2p", "raw_signer_id");
        ok &= check(p.raw_content == content, "raw_content");
        ok &= check(p.raw_signature.size() == 64, "raw_signature size");
        ok &= check(p.raw_signature.front() == 0xA0 && p.raw_signature.back() == 0xDF,
                    "raw_signature bytes");
        ok &= check(d.rest.empty(), "rest should be empty");
        ok &= check(d.signed_len == 40 + 16 + 13 + 10, "signed_len");
    } catch (const std::exception& e) {
        ok = fail(std::string("valid record threw: ") + e.what());
    }

    // Test 2: every truncation point, header and regions, is InsufficientData
    for (size_t len = 0; len < wire.size(); ++len) {
        su3::Error e = su3::Error::magic_mismatch();
        if (!expect_error(wire, len, su3::ErrorKind::InsufficientData,
                          "truncate to " + std::to_string(len), &e)) {
            ok = false;
            continue;
        }
        ok &= check(e.available() < e.required(),
                    "truncate to " + std::to_string(len) + ": available >= required");
    }

    // Test 3: short magic names the 6 bytes it needs
    {
        su3::Error e = su3::Error::magic_mismatch();
        ok &= expect_error(wire, 3, su3::ErrorKind::InsufficientData, "3-byte input", &e);
        ok &= check(e.required() == 6 && e.available() == 3, "3-byte input: required/available");
    }

    // Test 4: first byte flipped -> MagicMismatch
    {
        std::vector<uint8_t> bad = wire;
        bad[0] ^= 0xFF;
        ok &= expect_error(bad, bad.size(), su3::ErrorKind::MagicMismatch, "flipped magic");
    }

    // Test 5: unknown file type code 0xFF
    {
        std::vector<uint8_t> bad = wire;
        bad[25] = 0xFF;
        su3::Error e = su3::Error::magic_mismatch();
        ok &= expect_error(bad, bad.size(), su3::ErrorKind::UnknownEnumCode, "file type 0xFF", &e);
        ok &= check(e.field() == su3::EnumField::FileType && e.code() == 0xFF,
                    "file type 0xFF: field/code");
    }

    // Test 6: unassigned signature type 7
    {
        std::vector<uint8_t> bad = wire;
        bad[8] = 0x00;
        bad[9] = 0x07;
        su3::Error e = su3::Error::magic_mismatch();
        ok &= expect_error(bad, bad.size(), su3::ErrorKind::UnknownEnumCode, "signature type 7", &e);
        ok &= check(e.field() == su3::EnumField::SignatureType && e.code() == 7,
                    "signature type 7: field/code");
    }

    // Test 7: unknown content type 6
    {
        std::vector<uint8_t> bad = wire;
        bad[27] = 0x06;
        su3::Error e = su3::Error::magic_mismatch();
        ok &= expect_error(bad, bad.size(), su3::ErrorKind::UnknownEnumCode, "content type 6", &e);
        ok &= check(e.field() == su3::EnumField::ContentType, "content type 6: field");
    }

    // Test 8: region lengths are checked before enum codes
    {
        std::vector<uint8_t> bad = wire;
        bad[25] = 0xFF;
        ok &= expect_error(bad, bad.size() - 1, su3::ErrorKind::InsufficientData,
                           "truncated with bad file type");
    }

    // Test 9: huge content length reports the declared size
    {
        std::vector<uint8_t> bad = wire;
        for (int i = 16; i < 24; ++i) bad[i] = 0xFF;
        su3::Error e = su3::Error::magic_mismatch();
        ok &= expect_error(bad, bad.size(), su3::ErrorKind::InsufficientData, "huge content length", &e);
        ok &= check(e.required() == 0xFFFFFFFFFFFFFFFFULL, "huge content length: required");
        ok &= check(e.available() == 10 + 64, "huge content length: available");
    }

    // Test 10: trailing bytes are handed back, not rejected
    {
        std::vector<uint8_t> longer = wire;
        longer.push_back(0xDE);
        longer.push_back(0xAD);
        try {
            su3::Decoded d = su3::decode(longer);
            ok &= check(d.rest.size() == 2 && d.rest[0] == 0xDE && d.rest[1] == 0xAD,
                        "trailing bytes");
        } catch (const std::exception& e) {
            ok = fail(std::string("trailing bytes threw: ") + e.what());
        }
    }

    // Test 11: version shorter than 16 bytes still decodes
    {
        const std::vector<uint8_t> short_ver = {'1', '.', '0', 0x00};
        std::vector<uint8_t> w = build_raw(0x0000, 40, short_ver, "x", {}, 0x01, 0x00);
        try {
            su3::Decoded d = su3::decode(w);
            ok &= check(d.package.raw_version == short_ver, "short version kept");
            ok &= check(d.package.raw_content.empty(), "empty content");
            ok &= check(d.package.file_type == su3::FileType::Xml, "short version: file type");
        } catch (const std::exception& e) {
            ok = fail(std::string("short version threw: ") + e.what());
        }
    }

    // Test 12: unused and format-version bytes are ignored
    {
        std::vector<uint8_t> odd = wire;
        odd[6]  = 0x11;
        odd[7]  = 0x01;
        odd[12] = 0x22;
        odd[30] = 0x33;
        try {
            su3::Decoded d = su3::decode(odd);
            ok &= check(d.package.raw_content == content, "unused bytes: content");
        } catch (const std::exception& e) {
            ok = fail(std::string("unused bytes threw: ") + e.what());
        }
    }

    // Test 13: signature length field is taken as declared on decode
    {
        std::vector<uint8_t> w = build_raw(0x0001, 10, version, "a@b", content, 0x00, 0x00);
        try {
            su3::Decoded d = su3::decode(w);
            ok &= check(d.package.raw_signature.size() == 10, "declared signature length");
        } catch (const std::exception& e) {
            ok = fail(std::string("short signature threw: ") + e.what());
        }
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
