/**
 * In-Memory Binary Stream
 *
 * A growable byte buffer with a read/write position, for code that
 * assembles or consumes binary records incrementally (e.g. serializing
 * key material before it is hashed).
 *
 * Usage:
 *   cryptoutil::ByteStream stream;
 *   stream.write(cryptoutil::text_to_bytes(U"header"));
 *   stream.seek(0);
 *   auto tag = stream.read(6);
 */

#ifndef CRYPTOUTIL_BYTE_STREAM_HPP
#define CRYPTOUTIL_BYTE_STREAM_HPP

#include "bytes.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cryptoutil {

/**
 * Reference point for ByteStream::seek()
 */
enum class Whence {
    SET,  // From the start of the stream
    CUR,  // From the current position
    END   // From the end of the stream
};

class ByteStream {
public:
    ByteStream() = default;

    /** Stream positioned at 0 over a copy of initial */
    explicit ByteStream(std::span<const uint8_t> initial);

    /**
     * Write bytes at the current position, overwriting existing data and
     * growing the stream as needed. If the position is past the end, the
     * gap is filled with zero bytes.
     *
     * @return Number of bytes written
     */
    size_t write(std::span<const uint8_t> data);

    /**
     * Read up to n bytes from the current position.
     * A negative n, or MAX_INDEX, reads to the end.
     */
    [[nodiscard]] ByteString read(std::ptrdiff_t n = -1);

    /**
     * Move the position.
     *
     * @return The new absolute position
     * @throws RangeError if the resulting position would be negative
     */
    size_t seek(std::ptrdiff_t offset, Whence whence = Whence::SET);

    [[nodiscard]] size_t tell() const noexcept { return pos_; }
    [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }

    /**
     * Resize the stream to at most new_size bytes. The position is left
     * unchanged.
     *
     * @return The new size
     */
    size_t truncate(size_t new_size);

    /** Snapshot of the whole stream; later writes do not affect it */
    [[nodiscard]] ByteString getvalue() const;

private:
    std::vector<uint8_t> buffer_;
    size_t pos_ = 0;
};

} // namespace cryptoutil

#endif // CRYPTOUTIL_BYTE_STREAM_HPP
