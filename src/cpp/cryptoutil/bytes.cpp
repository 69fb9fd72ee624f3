/**
 * Byte Normalization Layer Implementation
 */

#include "bytes.hpp"
#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace cryptoutil {

namespace {

const std::shared_ptr<const std::vector<uint8_t>>& empty_storage() {
    static const auto storage = std::make_shared<const std::vector<uint8_t>>();
    return storage;
}

// Checked conversion of one byte-like integer
uint8_t checked_byte(long long c) {
    if (c < 0 || c > 0xFF) {
        throw RangeError(c);
    }
    return static_cast<uint8_t>(c);
}

// Clamp a single slice bound against a length, counting negatives from the end
size_t clamp_bound(std::ptrdiff_t bound, size_t length) noexcept {
    if (bound < 0) {
        // -(bound + 1) stays representable for PTRDIFF_MIN
        auto back = static_cast<size_t>(-(bound + 1)) + 1;
        return back >= length ? 0 : length - back;
    }
    return std::min(static_cast<size_t>(bound), length);
}

} // namespace

// ============================================================================
// SliceBounds
// ============================================================================

SliceBounds SliceBounds::resolve(
    std::ptrdiff_t start, std::ptrdiff_t stop, size_t length) noexcept {
    size_t b = clamp_bound(start, length);
    size_t e = clamp_bound(stop, length);
    if (e < b) {
        e = b;
    }
    return {b, e};
}

// ============================================================================
// ByteString
// ============================================================================

ByteString::ByteString()
    : storage_(empty_storage()) {}

ByteString::ByteString(std::vector<uint8_t> bytes)
    : storage_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))) {}

ByteString::ByteString(std::span<const uint8_t> bytes)
    : storage_(std::make_shared<const std::vector<uint8_t>>(bytes.begin(), bytes.end())) {}

ByteString::ByteString(std::initializer_list<uint8_t> bytes)
    : storage_(std::make_shared<const std::vector<uint8_t>>(bytes)) {}

std::span<const uint8_t> ByteString::view(std::ptrdiff_t start, std::ptrdiff_t end) const noexcept {
    auto bounds = SliceBounds::resolve(start, end, size());
    return span().subspan(bounds.begin, bounds.size());
}

bool operator==(const ByteString& a, const ByteString& b) noexcept {
    return a.storage_ == b.storage_ || *a.storage_ == *b.storage_;
}

// ============================================================================
// Conversions
// ============================================================================

ByteString text_to_bytes(Text s) {
    std::vector<uint8_t> out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] > MAX_BYTE_CODE_POINT) {
            throw EncodingError(s[i], i);
        }
        out.push_back(static_cast<uint8_t>(s[i]));
    }
    return ByteString(std::move(out));
}

ByteString byte_from_int(int c) {
    return ByteString(std::vector<uint8_t>{checked_byte(c)});
}

ByteString to_binary(const ByteSource& s) {
    return std::visit([](const auto& value) -> ByteString {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, ByteString>) {
            return value;
        } else if constexpr (std::is_same_v<T, Text>) {
            return text_to_bytes(value);
        } else if constexpr (std::is_same_v<T, MutableBytes> ||
                             std::is_same_v<T, ReadOnlyBytes>) {
            return ByteString(std::vector<uint8_t>(value.begin(), value.end()));
        } else if constexpr (std::is_same_v<T, IntSequence>) {
            std::vector<uint8_t> out;
            out.reserve(value.size());
            for (int element : value) {
                out.push_back(checked_byte(element));
            }
            return ByteString(std::move(out));
        } else {
            static_assert(std::is_same_v<T, int>);
            return byte_from_int(value);
        }
    }, s);
}

std::u32string to_text(std::span<const uint8_t> bs) {
    std::u32string out;
    out.reserve(bs.size());
    for (uint8_t byte : bs) {
        out.push_back(static_cast<char32_t>(byte));
    }
    return out;
}

// ============================================================================
// Classification
// ============================================================================

bool is_immutable(const ByteSource& value) noexcept {
    return std::holds_alternative<ByteString>(value) ||
           std::holds_alternative<ReadOnlyBytes>(value);
}

// ============================================================================
// Range Copies
// ============================================================================

ByteString copy_range(std::ptrdiff_t start, std::ptrdiff_t end, const ByteSource& container) {
    std::span<const uint8_t> source;
    if (const auto* bs = std::get_if<ByteString>(&container)) {
        // Already immutable; the slice still gets its own storage
        source = bs->span();
    } else if (const auto* m = std::get_if<MutableBytes>(&container)) {
        source = *m;
    } else if (const auto* r = std::get_if<ReadOnlyBytes>(&container)) {
        source = *r;
    } else {
        throw std::invalid_argument("copy_range requires a byte buffer or view");
    }

    auto bounds = SliceBounds::resolve(start, end, source.size());
    auto slice = source.subspan(bounds.begin, bounds.size());
    return ByteString(std::vector<uint8_t>(slice.begin(), slice.end()));
}

} // namespace cryptoutil
