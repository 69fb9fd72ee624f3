/**
 * Error Types for Byte Normalization
 *
 * All failures are contract violations reported immediately to the
 * caller. EncodingError and RangeError are the two kinds raised by the
 * conversion helpers; BytesError is their common base and is also used
 * directly for malformed hexadecimal input.
 */

#ifndef CRYPTOUTIL_ERRORS_HPP
#define CRYPTOUTIL_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cryptoutil {

// ============================================================================
// Error Types
// ============================================================================

/**
 * Byte conversion errors
 */
class BytesError : public std::runtime_error {
public:
    enum class Code {
        OK = 0,
        ENCODING,
        RANGE,
        INVALID_HEX
    };

    BytesError(Code code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] Code code() const { return code_; }

private:
    Code code_;
};

/**
 * A code point outside 0..255 was given to a text-to-bytes conversion
 */
class EncodingError : public BytesError {
public:
    EncodingError(char32_t code_point, size_t position)
        : BytesError(Code::ENCODING,
              "Code point " + std::to_string(static_cast<uint32_t>(code_point)) +
              " at position " + std::to_string(position) +
              " cannot be encoded as a single byte")
        , code_point_(code_point)
        , position_(position) {}

    [[nodiscard]] char32_t code_point() const { return code_point_; }
    [[nodiscard]] size_t position() const { return position_; }

private:
    char32_t code_point_;
    size_t position_;
};

/**
 * An integer outside its permitted range, normally a byte value outside 0..255
 */
class RangeError : public BytesError {
public:
    explicit RangeError(long long value)
        : RangeError(value,
              "Byte value " + std::to_string(value) + " is outside range 0..255") {}

    RangeError(long long value, const std::string& message)
        : BytesError(Code::RANGE, message), value_(value) {}

    [[nodiscard]] long long value() const { return value_; }

private:
    long long value_;
};

} // namespace cryptoutil

#endif // CRYPTOUTIL_ERRORS_HPP
