/**
 * Byte Normalization Demo
 * Shows how loosely typed inputs are turned into canonical byte strings
 * before they reach a hash or cipher.
 */

#include "cryptoutil/bytes.hpp"
#include "cryptoutil/hex.hpp"
#include "cryptoutil/byte_stream.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace cryptoutil;

static void print_bytes(const std::string& label, const ByteString& data) {
    std::cout << "    " << label << ": " << hex_string(data)
              << " (" << data.size() << " bytes)" << std::endl;
}

int main() {
    std::cout << std::string(60, '=') << std::endl;
    std::cout << "Byte Normalization Demo" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    // Every input shape ends up as the same kind of buffer
    std::cout << "\n[1] Canonicalizing inputs..." << std::endl;
    std::vector<uint8_t> scratch = {0x41, 0x42, 0x43};
    std::vector<int> codes = {0x41, 0x42, 0x43};
    print_bytes("text        ", to_binary(U"ABC"));
    print_bytes("mutable     ", to_binary(MutableBytes(scratch)));
    print_bytes("int sequence", to_binary(IntSequence(codes)));
    print_bytes("single byte ", to_binary(0x41));

    // Range copies are detached from the buffer they came from
    std::cout << "\n[2] Copying a nonce out of a scratch buffer..." << std::endl;
    std::vector<uint8_t> packet = {0x10, 0x20, 0x30, 0x40, 0x50};
    auto nonce = copy_range(1, 3, MutableBytes(packet));
    packet[1] = 0xFF;
    print_bytes("nonce after source write", nonce);
    std::cout << "    Source mutable: " << (is_mutable(MutableBytes(packet)) ? "yes" : "no")
              << ", copy immutable: " << (is_immutable(nonce) ? "yes" : "no") << std::endl;

    // Assemble a record incrementally
    std::cout << "\n[3] Building a record with ByteStream..." << std::endl;
    ByteStream record;
    record.write(text_to_bytes(U"key:"));
    record.write(byte_from_int(0x00));
    record.write(unhexlify("c0ffee"));
    print_bytes("record", record.getvalue());

    // Contract violations surface as exceptions
    std::cout << "\n[4] Rejecting out-of-range input..." << std::endl;
    try {
        (void)text_to_bytes(U"π");
    } catch (const EncodingError& e) {
        std::cout << "    EncodingError: " << e.what() << std::endl;
    }
    try {
        (void)byte_from_int(256);
    } catch (const RangeError& e) {
        std::cout << "    RangeError: " << e.what() << std::endl;
    }

    std::cout << "\n" << std::string(60, '=') << std::endl;
    return 0;
}
