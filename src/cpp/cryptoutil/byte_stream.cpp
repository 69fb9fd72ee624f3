/**
 * In-Memory Binary Stream Implementation
 */

#include "byte_stream.hpp"
#include <algorithm>
#include <string>

namespace cryptoutil {

ByteStream::ByteStream(std::span<const uint8_t> initial)
    : buffer_(initial.begin(), initial.end()) {}

size_t ByteStream::write(std::span<const uint8_t> data) {
    if (data.empty()) {
        return 0;
    }

    size_t end = pos_ + data.size();
    if (end > buffer_.size()) {
        buffer_.resize(end, 0);
    }
    std::copy(data.begin(), data.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = end;
    return data.size();
}

ByteString ByteStream::read(std::ptrdiff_t n) {
    if (pos_ >= buffer_.size()) {
        return ByteString();
    }

    size_t available = buffer_.size() - pos_;
    size_t count = (n < 0) ? available : std::min(static_cast<size_t>(n), available);
    auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(pos_);
    ByteString result(std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(count)));
    pos_ += count;
    return result;
}

size_t ByteStream::seek(std::ptrdiff_t offset, Whence whence) {
    std::ptrdiff_t base = 0;
    switch (whence) {
        case Whence::SET:
            base = 0;
            break;
        case Whence::CUR:
            base = static_cast<std::ptrdiff_t>(pos_);
            break;
        case Whence::END:
            base = static_cast<std::ptrdiff_t>(buffer_.size());
            break;
    }

    if ((offset < 0 && offset < -base) || (offset > 0 && offset > MAX_INDEX - base)) {
        throw RangeError(offset, "Seek offset " + std::to_string(offset) +
                                 " moves outside the stream");
    }
    pos_ = static_cast<size_t>(base + offset);
    return pos_;
}

size_t ByteStream::truncate(size_t new_size) {
    if (new_size < buffer_.size()) {
        buffer_.resize(new_size);
    }
    return buffer_.size();
}

ByteString ByteStream::getvalue() const {
    return ByteString(std::span<const uint8_t>(buffer_));
}

} // namespace cryptoutil
