#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

namespace su3 {

enum class ErrorKind {
    MagicMismatch,         // first 6 bytes are not "I2Psu3"
    InsufficientData,      // field or region runs past the end of the buffer
    UnknownEnumCode,       // type code outside the closed set
    InvalidVersionLength,  // raw_version shorter than 16 bytes on encode
    OutputTooSmall,        // encode_into capacity below encoded size
    TextDecode,            // version / signer id is not valid UTF-8
    Decompression,         // gzip content could not be inflated
};

enum class EnumField { None, SignatureType, FileType, ContentType };

const char* to_string(ErrorKind k);
const char* to_string(EnumField f);

// Thrown by the codec and its helpers. The payload accessors that do not
// apply to kind() return 0 (or EnumField::None).
class Error : public std::runtime_error {
public:
    static Error magic_mismatch();
    static Error insufficient_data(uint64_t required, uint64_t available);
    static Error unknown_enum_code(EnumField field, uint32_t code);
    static Error invalid_version_length(uint64_t actual);
    static Error output_too_small(uint64_t required, uint64_t available);
    static Error text_decode(const char* what_field, uint64_t offset);
    static Error decompression(const std::string& detail);

    ErrorKind kind()      const { return kind_; }
    uint64_t  required()  const { return required_; }
    uint64_t  available() const { return available_; }
    EnumField field()     const { return field_; }
    uint32_t  code()      const { return code_; }
    uint64_t  actual()    const { return actual_; }

private:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind_;
    uint64_t  required_  = 0;
    uint64_t  available_ = 0;
    EnumField field_     = EnumField::None;
    uint32_t  code_      = 0;
    uint64_t  actual_    = 0;
};

} // namespace su3
