/**
 * Hexadecimal Encoding/Decoding Implementation
 * OpenSSL-based
 */

#include "hex.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace cryptoutil {

namespace {

// Pop the most recent OpenSSL error and clear the rest of the queue
std::string take_openssl_error() {
    unsigned long err = ERR_peek_last_error();
    std::string message = "unknown OpenSSL error";
    if (err != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        message = buf;
    }
    ERR_clear_error();
    return message;
}

std::vector<char> encode_upper(std::span<const uint8_t> data) {
    // Two digits per byte plus the terminating NUL
    std::vector<char> out(data.size() * 2 + 1);
    size_t written = 0;
    if (OPENSSL_buf2hexstr_ex(out.data(), out.size(), &written,
                              data.data(), data.size(), '\0') != 1) {
        throw BytesError(BytesError::Code::INVALID_HEX,
                         "Hex encoding failed: " + take_openssl_error());
    }
    out.resize(written > 0 ? written - 1 : 0);
    return out;
}

} // namespace

ByteString hexlify(std::span<const uint8_t> data) {
    auto digits = encode_upper(data);
    std::vector<uint8_t> out(digits.size());
    std::transform(digits.begin(), digits.end(), out.begin(), [](char c) {
        return static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)));
    });
    return ByteString(std::move(out));
}

std::string hex_string(std::span<const uint8_t> data) {
    auto digits = encode_upper(data);
    std::string out(digits.begin(), digits.end());
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

ByteString unhexlify(std::string_view hex) {
    if (hex.empty()) {
        return ByteString();
    }
    if (hex.find('\0') != std::string_view::npos) {
        throw BytesError(BytesError::Code::INVALID_HEX,
                         "Hex string contains an embedded NUL");
    }
    if (hex.size() % 2 != 0) {
        throw BytesError(BytesError::Code::INVALID_HEX,
                         "Hex string has odd length " + std::to_string(hex.size()));
    }

    // OpenSSL needs a NUL-terminated string
    std::string terminated(hex);
    std::vector<uint8_t> out(hex.size() / 2);
    size_t decoded = 0;
    if (OPENSSL_hexstr2buf_ex(out.data(), out.size(), &decoded,
                              terminated.c_str(), '\0') != 1) {
        throw BytesError(BytesError::Code::INVALID_HEX,
                         "Invalid hex string: " + take_openssl_error());
    }
    out.resize(decoded);
    return ByteString(std::move(out));
}

ByteString unhexlify(std::span<const uint8_t> hex) {
    return unhexlify(std::string_view(reinterpret_cast<const char*>(hex.data()), hex.size()));
}

} // namespace cryptoutil
