#include "su3_text.hpp"
#include "su3_error.hpp"
#include <cstddef>

namespace su3 {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
size_t utf8_error_offset(const std::vector<uint8_t>& data) {
    const size_t n = data.size();
    size_t i = 0;
    while (i < n) {
        const uint8_t c = data[i];
        if (c < 0x80) { ++i; continue; }

        size_t   extra = 0;
        uint8_t  lo = 0x80, hi = 0xBF;   // bounds for the second byte
        if      (c >= 0xC2 && c <= 0xDF) extra = 1;
        else if (c == 0xE0)              { extra = 2; lo = 0xA0; }
        else if (c == 0xED)              { extra = 2; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) extra = 2;
        else if (c == 0xF0)              { extra = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) extra = 3;
        else if (c == 0xF4)              { extra = 3; hi = 0x8F; }
        else return i;

        if (i + extra >= n) return i;  // truncated sequence
        if (data[i + 1] < lo || data[i + 1] > hi) return i;
        for (size_t k = 2; k <= extra; ++k) {
            if (data[i + k] < 0x80 || data[i + k] > 0xBF) return i;
        }
        i += extra + 1;
    }
    return n;
}

static std::string checked_text(const std::vector<uint8_t>& raw, size_t len,
                                const char* what_field)
{
    std::vector<uint8_t> view(raw.begin(), raw.begin() + (std::ptrdiff_t)len);
    size_t bad = utf8_error_offset(view);
    if (bad != view.size())
        throw Error::text_decode(what_field, bad);
    return std::string(view.begin(), view.end());
}

std::string version_text(const Package& pkg) {
    size_t len = pkg.raw_version.size();
    while (len > 0 && pkg.raw_version[len - 1] == 0x00)
        --len;
    return checked_text(pkg.raw_version, len, "version");
}

std::string signer_id_text(const Package& pkg) {
    return checked_text(pkg.raw_signer_id, pkg.raw_signer_id.size(), "signer id");
}

std::vector<uint8_t> pad_version(const std::string& version) {
    std::vector<uint8_t> raw(version.begin(), version.end());
    if (raw.size() < kMinVersionLength)
        raw.resize(kMinVersionLength, 0x00);
    return raw;
}

} // namespace su3
