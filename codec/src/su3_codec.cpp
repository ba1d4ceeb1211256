#include "su3_codec.hpp"
#include "su3_types.hpp"
#include <cstring>

namespace su3 {

// ── Reader ────────────────────────────────────────────────────────────────────

namespace {

class Reader {
public:
    Reader(const uint8_t* data, size_t len) : p_(data), end_(data + len) {}

    size_t remaining() const { return (size_t)(end_ - p_); }

    const uint8_t* take(uint64_t n) {
        if (n > remaining())
            throw Error::insufficient_data(n, remaining());
        const uint8_t* at = p_;
        p_ += n;
        return at;
    }

    void skip(size_t n) { take(n); }

    uint8_t u8() { return *take(1); }

    uint16_t u16be() {
        const uint8_t* p = take(2);
        return (uint16_t)(((uint16_t)p[0] << 8) | (uint16_t)p[1]);
    }

    uint64_t u64be() {
        const uint8_t* p = take(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
            v = (v << 8) | (uint64_t)p[i];
        return v;
    }

    std::vector<uint8_t> bytes(uint64_t n) {
        const uint8_t* p = take(n);
        return std::vector<uint8_t>(p, p + n);
    }

private:
    const uint8_t* p_;
    const uint8_t* end_;
};

// Writes into a buffer already sized by encoded_size().
class Writer {
public:
    explicit Writer(uint8_t* out) : p_(out) {}

    void u8(uint8_t v) { *p_++ = v; }

    void u16be(uint16_t v) {
        *p_++ = (uint8_t)((v >> 8) & 0xFF);
        *p_++ = (uint8_t)((v >> 0) & 0xFF);
    }

    void u64be(uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8)
            *p_++ = (uint8_t)((v >> shift) & 0xFF);
    }

    void zeros(size_t n) {
        std::memset(p_, 0, n);
        p_ += n;
    }

    void bytes(const std::vector<uint8_t>& v) {
        if (!v.empty())
            std::memcpy(p_, v.data(), v.size());
        p_ += v.size();
    }

    void bytes(const char* s, size_t n) {
        std::memcpy(p_, s, n);
        p_ += n;
    }

private:
    uint8_t* p_;
};

} // namespace

// ── Decode ────────────────────────────────────────────────────────────────────

Decoded decode(const uint8_t* data, size_t len) {
    Reader r(data, len);

    if (std::memcmp(r.take(kMagicLen), kMagic, kMagicLen) != 0)
        throw Error::magic_mismatch();

    r.skip(1);  // unused
    r.skip(1);  // file format version

    const uint16_t sig_type_code  = r.u16be();
    const uint16_t sig_len        = r.u16be();
    r.skip(1);
    const uint8_t  version_len    = r.u8();
    r.skip(1);
    const uint8_t  signer_id_len  = r.u8();
    const uint64_t content_len    = r.u64be();
    r.skip(1);
    const uint8_t  file_type_code = r.u8();
    r.skip(1);
    const uint8_t  content_code   = r.u8();
    r.skip(12);

    Decoded out;
    Package& pkg = out.package;
    pkg.raw_version   = r.bytes(version_len);
    pkg.raw_signer_id = r.bytes(signer_id_len);
    pkg.raw_content   = r.bytes(content_len);
    out.signed_len    = len - r.remaining();
    pkg.raw_signature = r.bytes(sig_len);

    pkg.signature_type = signature_type_from_code(sig_type_code);
    pkg.file_type      = file_type_from_code(file_type_code);
    pkg.content_type   = content_type_from_code(content_code);

    out.rest = r.bytes(r.remaining());
    return out;
}

Decoded decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

// ── Encode ────────────────────────────────────────────────────────────────────

uint64_t encoded_size(const Package& pkg) {
    return (uint64_t)kHeaderSize
         + pkg.raw_version.size()
         + pkg.raw_signer_id.size()
         + pkg.raw_content.size()
         + pkg.raw_signature.size();
}

static void check_encodable(const Package& pkg) {
    if (pkg.raw_version.size() < kMinVersionLength)
        throw Error::invalid_version_length(pkg.raw_version.size());
}

static void write_package(const Package& pkg, uint8_t* out) {
    Writer w(out);

    w.bytes(kMagic, kMagicLen);
    w.u8(0x00);
    w.u8(0x00);
    w.u16be((uint16_t)pkg.signature_type);
    w.u16be(signature_length(pkg.signature_type));
    w.u8(0x00);
    w.u8((uint8_t)pkg.raw_version.size());    // truncates past 255
    w.u8(0x00);
    w.u8((uint8_t)pkg.raw_signer_id.size());  // truncates past 255
    w.u64be((uint64_t)pkg.raw_content.size());
    w.u8(0x00);
    w.u8((uint8_t)pkg.file_type);
    w.u8(0x00);
    w.u8((uint8_t)pkg.content_type);
    w.zeros(12);

    w.bytes(pkg.raw_version);
    w.bytes(pkg.raw_signer_id);
    w.bytes(pkg.raw_content);
    w.bytes(pkg.raw_signature);
}

std::vector<uint8_t> encode(const Package& pkg) {
    check_encodable(pkg);

    std::vector<uint8_t> out((size_t)encoded_size(pkg));
    write_package(pkg, out.data());
    return out;
}

size_t encode_into(const Package& pkg, uint8_t* out, size_t capacity) {
    check_encodable(pkg);

    const uint64_t need = encoded_size(pkg);
    if (need > capacity)
        throw Error::output_too_small(need, capacity);

    write_package(pkg, out);
    return (size_t)need;
}

} // namespace su3
