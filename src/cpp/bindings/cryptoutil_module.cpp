/**
 * Byte Normalization Python Bindings
 *
 * Exposes the cryptoutil byte helpers to Python under the names the
 * higher-level cipher and hash wrappers already use.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "common.hpp"
#include "cryptoutil/bytes.hpp"
#include "cryptoutil/hex.hpp"
#include <optional>

namespace py = pybind11;
using namespace cryptoutil;
using namespace cryptoutil_bindings;

namespace {

py::bytes py_b(const std::u32string& s) {
    return to_py_bytes(text_to_bytes(s));
}

py::bytes py_bchr(const py::int_& c) {
    return to_py_bytes(byte_from_int(to_byte_value(c)));
}

int py_bord(const py::int_& c) {
    return byte_to_int(static_cast<uint8_t>(to_byte_value(c)));
}

py::object py_tobytes(const py::object& s) {
    // bytes is already canonical; hand back the same object
    if (py::isinstance<py::bytes>(s)) {
        return s;
    }
    PyByteSource source(s);
    return to_py_bytes(to_binary(source.get()));
}

std::u32string py_tostr(const py::object& bs) {
    if (!py::isinstance<py::bytes>(bs) && !py::isinstance<py::bytearray>(bs) &&
        !py::isinstance<py::memoryview>(bs)) {
        throw py::type_error("tostr() expects bytes, bytearray or memoryview");
    }
    PyByteSource source(bs);
    return to_text(to_binary(source.get()));
}

py::bytes py_copy_bytes(std::optional<std::ptrdiff_t> start,
                        std::optional<std::ptrdiff_t> end,
                        const py::object& seq) {
    PyByteSource source(seq);
    if (!source.is_buffer()) {
        throw py::type_error("_copy_bytes() expects bytes, bytearray or memoryview");
    }

    // Bounds index elements; a memoryview over wider items is stored as raw bytes
    size_t itemsize = source.itemsize();
    if (itemsize == 1) {
        return to_py_bytes(copy_range(start.value_or(0), end.value_or(MAX_INDEX), source.get()));
    }
    auto bounds = SliceBounds::resolve(start.value_or(0), end.value_or(MAX_INDEX),
                                       source.byte_length() / itemsize);
    return to_py_bytes(copy_range(static_cast<std::ptrdiff_t>(bounds.begin * itemsize),
                                  static_cast<std::ptrdiff_t>(bounds.end * itemsize),
                                  source.get()));
}

py::bytes py_hexlify(const py::object& data) {
    PyByteSource source(data);
    return to_py_bytes(hexlify(to_binary(source.get())));
}

py::bytes py_unhexlify(const py::object& hexstr) {
    PyByteSource source(hexstr);
    return to_py_bytes(unhexlify(to_binary(source.get())));
}

} // namespace

PYBIND11_MODULE(_cryptoutil_native, m) {
    m.doc() = R"doc(
Byte normalization helpers

Every function takes the loosely typed value a caller hands to a cipher
or hash and produces (or inspects) plain bytes. Text is mapped with the
fixed 8-bit transform: code point N is byte N, for N in 0..255.

Example:
    >>> from cryptoutil import tobytes, _copy_bytes
    >>> tobytes("ABC")
    b'ABC'
    >>> _copy_bytes(1, 3, bytearray(b"\x10\x20\x30\x40"))
    b' 0'
)doc";

    auto& bytes_error = py::register_exception<BytesError>(
        m, "BytesError", PyExc_ValueError);
    py::register_exception<EncodingError>(m, "EncodingError", bytes_error.ptr());
    py::register_exception<RangeError>(m, "RangeError", bytes_error.ptr());

    m.def("b", &py_b, py::arg("s"),
        R"doc(
Encode a text literal as bytes.

Raises:
    EncodingError: If a code point exceeds 255.
)doc");

    m.def("bchr", &py_bchr, py::arg("c"),
        R"doc(
Make a one-byte bytes object from an integer.

Raises:
    RangeError: If c is outside 0..255.
)doc");

    m.def("bord", &py_bord, py::arg("c"),
        "Integer value of an element taken from a bytes object");

    m.def("tobytes", &py_tobytes, py::arg("s"),
        R"doc(
Normalize str, bytes, bytearray, memoryview, int or an iterable of ints
to bytes. A bytes argument is returned unchanged.

Raises:
    EncodingError: If a str contains a code point above 255.
    RangeError: If an integer is outside 0..255.
)doc");

    m.def("tostr", &py_tostr, py::arg("bs"),
        "Decode a bytes-like object to str, byte N becoming code point N");

    m.def("byte_string", [](const py::object& s) {
        return is_byte_string(classify_object(s));
    }, py::arg("s"), "True if s is a bytes object");

    m.def("_copy_bytes", &py_copy_bytes,
        py::arg("start"), py::arg("end"), py::arg("seq"),
        R"doc(
Immutable copy of seq[start:end] for bytes, bytearray or memoryview.
The result never shares memory with seq. None bounds mean the start
and the end of seq.
)doc");

    m.def("_is_immutable", [](const py::object& data) {
        return is_immutable(classify_object(data));
    }, py::arg("data"), "True for bytes and read-only memoryviews");

    m.def("_is_mutable", [](const py::object& data) {
        return is_mutable(classify_object(data));
    }, py::arg("data"), "Negation of _is_immutable");

    m.def("hexlify", &py_hexlify, py::arg("data"),
        "Lowercase hexadecimal representation of a bytes-like object");

    m.def("unhexlify", &py_unhexlify, py::arg("hexstr"),
        R"doc(
Decode hexadecimal digits to bytes.

Raises:
    BytesError: If the input has odd length or a non-hex character.
)doc");

    m.attr("maxint") = py::int_(MAX_INDEX);

    // Version info
    m.attr("__version__") = "1.0.0";
}
