#include "su3_error.hpp"
#include <string>

namespace su3 {

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::MagicMismatch:        return "magic mismatch";
        case ErrorKind::InsufficientData:     return "insufficient data";
        case ErrorKind::UnknownEnumCode:      return "unknown enum code";
        case ErrorKind::InvalidVersionLength: return "invalid version length";
        case ErrorKind::OutputTooSmall:       return "output too small";
        case ErrorKind::TextDecode:           return "text decode";
        case ErrorKind::Decompression:        return "decompression";
    }
    return "unknown";
}

const char* to_string(EnumField f) {
    switch (f) {
        case EnumField::None:          return "none";
        case EnumField::SignatureType: return "signature type";
        case EnumField::FileType:      return "file type";
        case EnumField::ContentType:   return "content type";
    }
    return "unknown";
}

Error Error::magic_mismatch() {
    return Error(ErrorKind::MagicMismatch, "SU3: invalid magic (expected I2Psu3)");
}

Error Error::insufficient_data(uint64_t required, uint64_t available) {
    Error e(ErrorKind::InsufficientData,
            "SU3: truncated input, need " + std::to_string(required) +
            " bytes but only " + std::to_string(available) + " available");
    e.required_  = required;
    e.available_ = available;
    return e;
}

Error Error::unknown_enum_code(EnumField field, uint32_t code) {
    Error e(ErrorKind::UnknownEnumCode,
            std::string("SU3: unknown ") + to_string(field) +
            " code " + std::to_string(code));
    e.field_ = field;
    e.code_  = code;
    return e;
}

Error Error::invalid_version_length(uint64_t actual) {
    Error e(ErrorKind::InvalidVersionLength,
            "SU3: version must be at least 16 bytes (got " +
            std::to_string(actual) + ")");
    e.actual_ = actual;
    return e;
}

Error Error::output_too_small(uint64_t required, uint64_t available) {
    Error e(ErrorKind::OutputTooSmall,
            "SU3: output buffer too small, need " + std::to_string(required) +
            " bytes, have " + std::to_string(available));
    e.required_  = required;
    e.available_ = available;
    return e;
}

Error Error::text_decode(const char* what_field, uint64_t offset) {
    Error e(ErrorKind::TextDecode,
            std::string("SU3: ") + what_field +
            " is not valid UTF-8 at offset " + std::to_string(offset));
    e.actual_ = offset;
    return e;
}

Error Error::decompression(const std::string& detail) {
    return Error(ErrorKind::Decompression, "SU3: gzip content: " + detail);
}

} // namespace su3
