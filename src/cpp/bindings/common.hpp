/**
 * Common utilities for pybind11 bindings
 *
 * Maps Python bytes-like objects onto cryptoutil::ByteSource and converts
 * ByteString results back to Python bytes.
 */

#ifndef CRYPTOUTIL_BINDINGS_COMMON_HPP
#define CRYPTOUTIL_BINDINGS_COMMON_HPP

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "cryptoutil/bytes.hpp"
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace cryptoutil_bindings {

/**
 * Convert ByteString to Python bytes
 */
inline py::bytes to_py_bytes(const cryptoutil::ByteString& b) {
    return py::bytes(reinterpret_cast<const char*>(b.data()), b.size());
}

/**
 * Copy Python bytes into a ByteString
 */
inline cryptoutil::ByteString from_py_bytes(const py::bytes& b) {
    char* buffer = nullptr;
    Py_ssize_t length = 0;
    if (PYBIND11_BYTES_AS_STRING_AND_SIZE(b.ptr(), &buffer, &length) != 0) {
        throw py::error_already_set();
    }
    auto* first = reinterpret_cast<const uint8_t*>(buffer);
    return cryptoutil::ByteString(std::span<const uint8_t>(first, static_cast<size_t>(length)));
}

/**
 * Range-check a Python integer as a byte value.
 * Integers too large for long long are reported as RangeError as well.
 */
inline int to_byte_value(const py::handle& obj) {
    int overflow = 0;
    long long value = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
    if (overflow != 0) {
        long long saturated = overflow > 0 ? std::numeric_limits<long long>::max()
                                           : std::numeric_limits<long long>::min();
        throw cryptoutil::RangeError(saturated,
            "Byte value " + py::str(obj).cast<std::string>() + " is outside range 0..255");
    }
    if (value == -1 && PyErr_Occurred()) {
        throw py::error_already_set();
    }
    if (value < 0 || value > 0xFF) {
        throw cryptoutil::RangeError(value);
    }
    return static_cast<int>(value);
}

/**
 * Shape of a Python object as seen by the classification helpers.
 * Only the alternative matters, so no data is copied.
 */
inline cryptoutil::ByteSource classify_object(const py::handle& obj) {
    if (py::isinstance<py::bytes>(obj)) {
        return cryptoutil::ByteString();
    }
    if (py::isinstance<py::str>(obj)) {
        return cryptoutil::Text();
    }
    if (py::isinstance<py::memoryview>(obj)) {
        if (obj.attr("readonly").cast<bool>()) {
            return cryptoutil::ReadOnlyBytes();
        }
        return cryptoutil::MutableBytes();
    }
    if (py::isinstance<py::bytearray>(obj)) {
        return cryptoutil::MutableBytes();
    }
    if (py::isinstance<py::int_>(obj)) {
        return 0;
    }
    return cryptoutil::IntSequence();
}

/**
 * Owns whatever backing data a ByteSource built from a Python object
 * refers to. Must outlive every use of get().
 */
class PyByteSource {
public:
    explicit PyByteSource(const py::handle& obj) {
        if (py::isinstance<py::bytes>(obj)) {
            source_ = from_py_bytes(py::reinterpret_borrow<py::bytes>(obj));
        } else if (py::isinstance<py::str>(obj)) {
            text_ = obj.cast<std::u32string>();
            source_ = cryptoutil::Text(text_);
        } else if (py::isinstance<py::memoryview>(obj) || py::isinstance<py::bytearray>(obj)) {
            bind_buffer(obj);
        } else if (py::isinstance<py::int_>(obj)) {
            source_ = to_byte_value(obj);
        } else if (py::isinstance<py::iterable>(obj)) {
            for (auto item : obj) {
                ints_.push_back(to_byte_value(item));
            }
            source_ = cryptoutil::IntSequence(ints_);
        } else {
            throw py::type_error("Expected str, bytes, bytearray, memoryview, int "
                                 "or an iterable of ints");
        }
    }

    PyByteSource(const PyByteSource&) = delete;
    PyByteSource& operator=(const PyByteSource&) = delete;

    [[nodiscard]] const cryptoutil::ByteSource& get() const { return source_; }

    /** True when built from bytes, bytearray or memoryview */
    [[nodiscard]] bool is_buffer() const {
        return cryptoutil::is_byte_string(source_) ||
               std::holds_alternative<cryptoutil::MutableBytes>(source_) ||
               std::holds_alternative<cryptoutil::ReadOnlyBytes>(source_);
    }

    /** Bytes per element; greater than 1 for memoryviews over wider types */
    [[nodiscard]] size_t itemsize() const { return itemsize_; }

    /** Length in bytes of a buffer-backed source */
    [[nodiscard]] size_t byte_length() const { return byte_length_; }

private:
    void bind_buffer(const py::handle& obj) {
        auto buffer = py::reinterpret_borrow<py::buffer>(obj);
        info_ = buffer.request();
        if (info_.ndim > 1 || (info_.ndim == 1 && info_.strides[0] != info_.itemsize)) {
            throw std::invalid_argument("Only contiguous one-dimensional buffers are supported");
        }
        auto* first = static_cast<uint8_t*>(info_.ptr);
        itemsize_ = static_cast<size_t>(info_.itemsize);
        byte_length_ = static_cast<size_t>(info_.size) * itemsize_;
        if (info_.readonly) {
            source_ = cryptoutil::ReadOnlyBytes(first, byte_length_);
        } else {
            source_ = cryptoutil::MutableBytes(first, byte_length_);
        }
    }

    cryptoutil::ByteSource source_;
    std::u32string text_;
    std::vector<int> ints_;
    py::buffer_info info_;
    size_t itemsize_ = 1;
    size_t byte_length_ = 0;
};

} // namespace cryptoutil_bindings

#endif // CRYPTOUTIL_BINDINGS_COMMON_HPP
