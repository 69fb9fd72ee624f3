/**
 * Byte Normalization Layer
 *
 * Turns the different shapes binary data arrives in (text literals,
 * immutable byte strings, mutable buffers, read-only views, sequences of
 * small integers, single byte values) into one canonical immutable
 * buffer, and converts back.
 *
 * Text maps to bytes through the fixed 8-bit transform: code point N is
 * byte N, for N in 0..255. Nothing else is ever negotiated.
 *
 * Every function here is stateless and may be called concurrently, as
 * long as a mutable input buffer is not written to during the call.
 *
 * Usage:
 *   auto key = cryptoutil::text_to_bytes(U"secret");
 *   std::vector<uint8_t> scratch = {1, 2, 3, 4};
 *   auto nonce = cryptoutil::copy_range(1, 3, cryptoutil::MutableBytes(scratch));
 *   scratch[1] = 0xFF;   // nonce still holds {2, 3}
 */

#ifndef CRYPTOUTIL_BYTES_HPP
#define CRYPTOUTIL_BYTES_HPP

#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cryptoutil {

/**
 * Largest index accepted anywhere a range bound or length is taken.
 * Passing it as an end bound means "up to the end".
 */
inline constexpr std::ptrdiff_t MAX_INDEX = std::numeric_limits<std::ptrdiff_t>::max();

/** Highest code point the fixed 8-bit transform can represent */
inline constexpr char32_t MAX_BYTE_CODE_POINT = 0xFF;

/**
 * Half-open range [begin, end) resolved against a sequence length
 *
 * Negative bounds count from the end; anything past either end is
 * clamped. A reordered range resolves to an empty one.
 */
struct SliceBounds {
    size_t begin = 0;
    size_t end = 0;

    [[nodiscard]] size_t size() const noexcept { return end - begin; }

    [[nodiscard]] static SliceBounds resolve(
        std::ptrdiff_t start, std::ptrdiff_t stop, size_t length) noexcept;
};

/**
 * Immutable binary buffer
 *
 * The bytes are fixed at construction. Copies share the same storage,
 * so handing a ByteString around never duplicates its contents.
 */
class ByteString {
public:
    using value_type = uint8_t;
    using const_iterator = std::vector<uint8_t>::const_iterator;

    ByteString();
    explicit ByteString(std::vector<uint8_t> bytes);
    explicit ByteString(std::span<const uint8_t> bytes);
    ByteString(std::initializer_list<uint8_t> bytes);

    // ByteString is itself a contiguous range, so it converts implicitly
    // to std::span<const uint8_t>.

    [[nodiscard]] size_t size() const noexcept { return storage_->size(); }
    [[nodiscard]] bool empty() const noexcept { return storage_->empty(); }
    [[nodiscard]] const uint8_t* data() const noexcept { return storage_->data(); }

    /** Element access yields the byte value itself */
    [[nodiscard]] uint8_t operator[](size_t i) const noexcept { return (*storage_)[i]; }
    [[nodiscard]] uint8_t at(size_t i) const { return storage_->at(i); }

    [[nodiscard]] const_iterator begin() const noexcept { return storage_->begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return storage_->end(); }

    [[nodiscard]] std::span<const uint8_t> span() const noexcept { return *storage_; }

    /**
     * Zero-copy read-only view of [start, end), slice-clamped.
     * The view is valid for as long as any copy of this ByteString lives.
     */
    [[nodiscard]] std::span<const uint8_t> view(std::ptrdiff_t start, std::ptrdiff_t end) const noexcept;

    /** Independent writable copy of the contents */
    [[nodiscard]] std::vector<uint8_t> to_vector() const { return *storage_; }

    /** True when both refer to the same underlying storage */
    [[nodiscard]] bool shares_storage_with(const ByteString& other) const noexcept {
        return storage_ == other.storage_;
    }

    friend bool operator==(const ByteString& a, const ByteString& b) noexcept;

private:
    std::shared_ptr<const std::vector<uint8_t>> storage_;
};

// ============================================================================
// Input Shapes
// ============================================================================

/** Textual value, one element per Unicode code point */
using Text = std::u32string_view;

/** Writable buffer owned by the caller */
using MutableBytes = std::span<uint8_t>;

/** Read-only view over a buffer */
using ReadOnlyBytes = std::span<const uint8_t>;

/** Sequence of byte-like integers, each expected in 0..255 */
using IntSequence = std::span<const int>;

/**
 * Any value the normalization layer accepts.
 *
 * The alternatives are views: a ByteSource must not outlive the data it
 * was built from. Build the alternative explicitly when the argument
 * could convert to more than one, e.g. MutableBytes(vec).
 */
using ByteSource = std::variant<Text, ByteString, MutableBytes, ReadOnlyBytes, IntSequence, int>;

// ============================================================================
// Conversions
// ============================================================================

/**
 * Encode a text literal with the fixed 8-bit transform.
 * @throws EncodingError if any code point exceeds 255
 */
[[nodiscard]] ByteString text_to_bytes(Text s);

/**
 * One-byte buffer holding c.
 * @throws RangeError unless 0 <= c <= 255
 */
[[nodiscard]] ByteString byte_from_int(int c);

/**
 * Integer code of a buffer element. Indexing a ByteString already yields
 * the value, so this is the identity on 0..255.
 */
[[nodiscard]] constexpr int byte_to_int(uint8_t element) noexcept {
    return static_cast<int>(element);
}

/**
 * Canonicalize any accepted input to a ByteString.
 *
 * - ByteString: returned as is, sharing storage
 * - Text: fixed 8-bit transform (EncodingError past 255)
 * - MutableBytes / ReadOnlyBytes: copied into fresh storage
 * - IntSequence: one byte per element (RangeError outside 0..255)
 * - int: one-byte buffer (RangeError outside 0..255)
 */
[[nodiscard]] ByteString to_binary(const ByteSource& s);

/**
 * Decode bytes with the inverse 8-bit transform. Never fails.
 */
[[nodiscard]] std::u32string to_text(std::span<const uint8_t> bs);

// ============================================================================
// Classification
// ============================================================================

/**
 * True for a ByteString or a read-only view; false for text, mutable
 * buffers, integer sequences and single integers.
 */
[[nodiscard]] bool is_immutable(const ByteSource& value) noexcept;

/** Logical negation of is_immutable() */
[[nodiscard]] inline bool is_mutable(const ByteSource& value) noexcept {
    return !is_immutable(value);
}

/** True only for the ByteString alternative */
[[nodiscard]] inline bool is_byte_string(const ByteSource& value) noexcept {
    return std::holds_alternative<ByteString>(value);
}

// ============================================================================
// Range Copies
// ============================================================================

/**
 * Immutable copy of the elements in [start, end) of a buffer.
 *
 * Accepts ByteString, MutableBytes or ReadOnlyBytes. The result never
 * aliases the container: later writes to either side are invisible to
 * the other. Bounds follow SliceBounds::resolve().
 *
 * @throws std::invalid_argument if the source is not a byte buffer
 */
[[nodiscard]] ByteString copy_range(std::ptrdiff_t start, std::ptrdiff_t end, const ByteSource& container);

} // namespace cryptoutil

#endif // CRYPTOUTIL_BYTES_HPP
