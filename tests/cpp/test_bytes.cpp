/**
 * Byte Normalization Test Suite
 * Tests for text/byte conversion, classification and range copies
 */

#include "cryptoutil/bytes.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace cryptoutil;

// Simple test framework
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) \
    std::cout << "Testing " << name << "... " << std::flush; \
    try

#define TEST_END \
    std::cout << "PASSED" << std::endl; \
    ++tests_passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << std::endl; \
        ++tests_failed; \
    } catch (...) { \
        std::cout << "FAILED: Unknown exception" << std::endl; \
        ++tests_failed; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond)

#define ASSERT_FALSE(cond) \
    if (cond) throw std::runtime_error("Assertion failed: NOT " #cond)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("Assertion failed: " #a " == " #b)

#define ASSERT_THROWS_AS(expr, type) \
    { \
        bool threw = false; \
        try { (void)(expr); } catch (const type&) { threw = true; } \
        if (!threw) throw std::runtime_error("Expected " #type ": " #expr); \
    }

void test_text_to_bytes() {
    TEST("text_to_bytes maps ASCII") {
        auto b = text_to_bytes(U"ABC");
        ASSERT_TRUE(b == (ByteString{0x41, 0x42, 0x43}));
    TEST_END

    TEST("text_to_bytes maps full 8-bit range") {
        std::u32string s;
        for (char32_t c = 0; c <= 0xFF; ++c) {
            s.push_back(c);
        }
        auto b = text_to_bytes(s);
        ASSERT_EQ(b.size(), static_cast<size_t>(256));
        for (size_t i = 0; i < b.size(); ++i) {
            ASSERT_EQ(b[i], static_cast<uint8_t>(i));
        }
    TEST_END

    TEST("text_to_bytes of empty text is empty") {
        ASSERT_TRUE(text_to_bytes(U"").empty());
    TEST_END

    TEST("text_to_bytes rejects code point 256") {
        ASSERT_THROWS_AS(text_to_bytes(U"abĀ"), EncodingError);
    TEST_END

    TEST("EncodingError reports code point and position") {
        try {
            (void)text_to_bytes(U"xy€z");
            throw std::runtime_error("no exception");
        } catch (const EncodingError& e) {
            ASSERT_EQ(e.code_point(), U'€');
            ASSERT_EQ(e.position(), static_cast<size_t>(2));
            ASSERT_TRUE(e.code() == BytesError::Code::ENCODING);
        }
    TEST_END
}

void test_single_bytes() {
    TEST("byte_from_int boundaries succeed") {
        auto zero = byte_from_int(0);
        auto max = byte_from_int(255);
        ASSERT_EQ(zero.size(), static_cast<size_t>(1));
        ASSERT_EQ(max.size(), static_cast<size_t>(1));
        ASSERT_EQ(zero[0], 0);
        ASSERT_EQ(max[0], 255);
    TEST_END

    TEST("byte_from_int rejects 256 and -1") {
        ASSERT_THROWS_AS(byte_from_int(256), RangeError);
        ASSERT_THROWS_AS(byte_from_int(-1), RangeError);
    TEST_END

    TEST("RangeError carries the value") {
        try {
            (void)byte_from_int(-7);
            throw std::runtime_error("no exception");
        } catch (const RangeError& e) {
            ASSERT_EQ(e.value(), -7);
            ASSERT_TRUE(e.code() == BytesError::Code::RANGE);
        }
    TEST_END

    TEST("byte_to_int inverts byte_from_int for all values") {
        for (int c = 0; c <= 255; ++c) {
            ASSERT_EQ(byte_to_int(byte_from_int(c)[0]), c);
        }
    TEST_END

    TEST("byte_to_int is usable at compile time") {
        static_assert(byte_to_int(0xFF) == 255);
        ASSERT_EQ(byte_to_int(0x41), 65);
    TEST_END
}

void test_to_binary() {
    TEST("to_binary of text") {
        auto b = to_binary(U"ABC");
        ASSERT_TRUE(b == (ByteString{0x41, 0x42, 0x43}));
    TEST_END

    TEST("to_binary of text above 255 fails") {
        ASSERT_THROWS_AS(to_binary(U"Ѐ"), EncodingError);
    TEST_END

    TEST("to_binary of ByteString is identity") {
        ByteString b{1, 2, 3};
        auto same = to_binary(b);
        ASSERT_TRUE(same == b);
        ASSERT_TRUE(same.shares_storage_with(b));
    TEST_END

    TEST("to_binary copies a mutable buffer") {
        std::vector<uint8_t> buf = {9, 8, 7};
        auto b = to_binary(MutableBytes(buf));
        buf[0] = 0;
        ASSERT_TRUE(b == (ByteString{9, 8, 7}));
    TEST_END

    TEST("to_binary copies a read-only view") {
        std::vector<uint8_t> buf = {5, 6};
        auto b = to_binary(ReadOnlyBytes(buf));
        buf[1] = 0;
        ASSERT_TRUE(b == (ByteString{5, 6}));
    TEST_END

    TEST("to_binary of integer sequence") {
        std::vector<int> ints = {0, 127, 255};
        auto b = to_binary(IntSequence(ints));
        ASSERT_TRUE(b == (ByteString{0x00, 0x7F, 0xFF}));
    TEST_END

    TEST("to_binary of integer sequence out of range") {
        std::vector<int> ints = {1, 300};
        ASSERT_THROWS_AS(to_binary(IntSequence(ints)), RangeError);
    TEST_END

    TEST("to_binary of single integer") {
        auto b = to_binary(0x2A);
        ASSERT_TRUE(b == (ByteString{0x2A}));
        ASSERT_THROWS_AS(to_binary(-1), RangeError);
    TEST_END
}

void test_to_text() {
    TEST("to_text of ASCII bytes") {
        ByteString b{0x41, 0x42, 0x43};
        ASSERT_TRUE(to_text(b) == U"ABC");
    TEST_END

    TEST("to_text never fails on high bytes") {
        std::vector<uint8_t> raw = {0x80, 0xE9, 0xFF};
        ASSERT_TRUE(to_text(raw) == U"\u0080éÿ");
    TEST_END

    TEST("text round-trip through to_binary") {
        std::u32string s = U"café ÿ\u0001";
        ASSERT_TRUE(to_text(to_binary(s)) == s);
    TEST_END
}

void test_classification() {
    std::vector<uint8_t> buf = {1, 2, 3};
    ByteString bs{1, 2, 3};

    TEST("ByteString is immutable") {
        ASSERT_TRUE(is_immutable(bs));
        ASSERT_FALSE(is_mutable(bs));
    TEST_END

    TEST("read-only view is immutable") {
        ASSERT_TRUE(is_immutable(ReadOnlyBytes(buf)));
        ASSERT_FALSE(is_mutable(ReadOnlyBytes(buf)));
    TEST_END

    TEST("mutable buffer is mutable") {
        ASSERT_FALSE(is_immutable(MutableBytes(buf)));
        ASSERT_TRUE(is_mutable(MutableBytes(buf)));
    TEST_END

    TEST("text is not an immutable buffer") {
        ASSERT_FALSE(is_immutable(U"abc"));
        ASSERT_TRUE(is_mutable(U"abc"));
    TEST_END

    TEST("is_byte_string only for ByteString") {
        ASSERT_TRUE(is_byte_string(bs));
        ASSERT_FALSE(is_byte_string(ReadOnlyBytes(buf)));
        ASSERT_FALSE(is_byte_string(MutableBytes(buf)));
        ASSERT_FALSE(is_byte_string(U"abc"));
    TEST_END
}

void test_copy_range() {
    TEST("copy_range basic") {
        std::vector<uint8_t> src = {0x10, 0x20, 0x30, 0x40};
        auto c = copy_range(0, 2, MutableBytes(src));
        ASSERT_TRUE(c == (ByteString{0x10, 0x20}));
    TEST_END

    TEST("copy_range clamps end past length") {
        std::vector<uint8_t> src = {0x10, 0x20, 0x30, 0x40};
        auto c = copy_range(2, 100, MutableBytes(src));
        ASSERT_TRUE(c == (ByteString{0x30, 0x40}));
    TEST_END

    TEST("copy_range result does not alias source") {
        std::vector<uint8_t> m = {1, 2, 3, 4, 5};
        auto c = copy_range(1, 3, MutableBytes(m));
        m[1] = 0xAA;
        m[2] = 0xBB;
        ASSERT_TRUE(c == (ByteString{2, 3}));

        auto writable = c.to_vector();
        writable[0] = 0xCC;
        ASSERT_EQ(m[1], 0xAA);
        ASSERT_EQ(c[0], 2);
    TEST_END

    TEST("copy_range of ByteString gets fresh storage") {
        ByteString b{1, 2, 3, 4};
        auto c = copy_range(0, 4, b);
        ASSERT_TRUE(c == b);
        ASSERT_FALSE(c.shares_storage_with(b));
    TEST_END

    TEST("copy_range of read-only view") {
        ByteString b{1, 2, 3, 4};
        auto c = copy_range(1, 2, ReadOnlyBytes(b.view(1, 4)));
        ASSERT_TRUE(c == (ByteString{3}));
    TEST_END

    TEST("copy_range reordered bounds are empty") {
        std::vector<uint8_t> src = {1, 2, 3};
        ASSERT_TRUE(copy_range(2, 1, MutableBytes(src)).empty());
        ASSERT_TRUE(copy_range(5, 9, MutableBytes(src)).empty());
    TEST_END

    TEST("copy_range negative bounds count from end") {
        std::vector<uint8_t> src = {1, 2, 3, 4};
        ASSERT_TRUE(copy_range(-3, -1, MutableBytes(src)) == (ByteString{2, 3}));
        ASSERT_TRUE(copy_range(-100, 2, MutableBytes(src)) == (ByteString{1, 2}));
        ASSERT_TRUE(copy_range(0, -10, MutableBytes(src)).empty());
    TEST_END

    TEST("copy_range to MAX_INDEX copies the tail") {
        std::vector<uint8_t> src = {1, 2, 3};
        ASSERT_TRUE(copy_range(1, MAX_INDEX, MutableBytes(src)) == (ByteString{2, 3}));
    TEST_END

    TEST("copy_range rejects non-buffer input") {
        ASSERT_THROWS_AS(copy_range(0, 1, U"abc"), std::invalid_argument);
        ASSERT_THROWS_AS(copy_range(0, 1, 7), std::invalid_argument);
    TEST_END
}

void test_byte_string() {
    TEST("ByteString copies share storage") {
        ByteString a{1, 2, 3};
        ByteString b = a;
        ASSERT_TRUE(a.shares_storage_with(b));
        ASSERT_EQ(a.data(), b.data());
    TEST_END

    TEST("ByteString equality compares contents") {
        ByteString a{1, 2, 3};
        ByteString b(std::vector<uint8_t>{1, 2, 3});
        ASSERT_TRUE(a == b);
        ASSERT_FALSE(a.shares_storage_with(b));
        ASSERT_FALSE(a == (ByteString{1, 2}));
    TEST_END

    TEST("ByteString view is zero-copy") {
        ByteString a{1, 2, 3, 4};
        auto v = a.view(1, 3);
        ASSERT_EQ(v.size(), static_cast<size_t>(2));
        ASSERT_EQ(v.data(), a.data() + 1);
    TEST_END

    TEST("ByteString at() checks bounds") {
        ByteString a{1};
        ASSERT_EQ(a.at(0), 1);
        ASSERT_THROWS_AS(a.at(1), std::out_of_range);
    TEST_END

    TEST("default ByteString is empty") {
        ByteString a;
        ASSERT_TRUE(a.empty());
        ASSERT_TRUE(a == ByteString(std::vector<uint8_t>{}));
    TEST_END
}

int main() {
    std::cout << "=== Byte Normalization Test Suite ===" << std::endl;

    std::cout << std::endl << "--- Text Conversion ---" << std::endl;
    test_text_to_bytes();
    test_to_text();

    std::cout << std::endl << "--- Single Bytes ---" << std::endl;
    test_single_bytes();

    std::cout << std::endl << "--- Canonicalization ---" << std::endl;
    test_to_binary();
    test_byte_string();

    std::cout << std::endl << "--- Classification ---" << std::endl;
    test_classification();

    std::cout << std::endl << "--- Range Copies ---" << std::endl;
    test_copy_range();

    std::cout << std::endl << "=== Test Results ===" << std::endl;
    std::cout << "Passed: " << tests_passed << std::endl;
    std::cout << "Failed: " << tests_failed << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
