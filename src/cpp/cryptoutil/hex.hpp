/**
 * Hexadecimal Encoding/Decoding
 *
 * Thin wrappers over OpenSSL's buffer/hex-string helpers that speak
 * ByteString. Encoding produces lowercase digits; decoding accepts
 * either case.
 */

#ifndef CRYPTOUTIL_HEX_HPP
#define CRYPTOUTIL_HEX_HPP

#include "bytes.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace cryptoutil {

/**
 * Encode bytes as lowercase hexadecimal
 *
 * @param data Bytes to encode
 * @return Two ASCII digits per input byte, as a ByteString
 */
[[nodiscard]] ByteString hexlify(std::span<const uint8_t> data);

/**
 * Same as hexlify(), returned as a std::string
 */
[[nodiscard]] std::string hex_string(std::span<const uint8_t> data);

/**
 * Decode hexadecimal digits (no separators)
 *
 * @param hex Even number of hex digits, upper or lower case
 * @return Decoded bytes
 * @throws BytesError with code INVALID_HEX on odd length, a non-hex
 *         character or an embedded NUL
 */
[[nodiscard]] ByteString unhexlify(std::string_view hex);

/**
 * Decode hexadecimal digits held in a byte buffer
 */
[[nodiscard]] ByteString unhexlify(std::span<const uint8_t> hex);

} // namespace cryptoutil

#endif // CRYPTOUTIL_HEX_HPP
