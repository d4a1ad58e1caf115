#include "bit_packer.hpp"
#include "test_utils.hpp"

#include <iostream>
#include <string>
#include <vector>

using test_utils::expect;

int main() {
    std::cout << "=== Testing BitPacker ===" << std::endl;

    // Plain ASCII payload, MSB first.
    const std::string payload = "12345432;12345432";
    std::vector<uint8_t> bits = test_utils::text_bits(payload);
    expect(bits.size() == payload.size() * 8, "reference bit stream length");
    expect(BitPacker::decode(bits) == payload, "ASCII payload decodes to the original text");
    expect(BitPacker::unpack(payload) == bits, "unpack produces MSB-first bits");

    // 13 bits are padded with three zero bits into two bytes.
    std::vector<uint8_t> thirteen = {1, 0, 1, 0, 0, 1, 0, 1, 1, 1, 1, 1, 1};
    std::vector<uint8_t> packed = BitPacker::pack(thirteen);
    expect(packed.size() == 2, "13 bits pack into 2 bytes");
    expect(packed[0] == 0xA5, "first byte packed MSB first");
    expect(packed[1] == 0xF8, "second byte keeps the five set bits");
    expect((packed[1] & 0x07) == 0, "padding bits are zero");

    // Aligned input gets no padding.
    expect(BitPacker::pack(std::vector<uint8_t>(16, 1)).size() == 2, "16 bits pack into 2 bytes");

    // Invalid UTF-8 falls back to hex.
    std::vector<uint8_t> invalid = BitPacker::unpack(std::vector<uint8_t>{0xFF, 0xFE});
    std::string hex = BitPacker::decode(invalid);
    expect(hex.compare(0, 6, "[HEX] ") == 0, "fallback starts with the hex marker");
    expect(hex == "[HEX] FF FE", "fallback lists each byte in uppercase hex");

    // Trailing NULs are trimmed from text.
    std::vector<uint8_t> with_nul = test_utils::text_bits("OK");
    with_nul.insert(with_nul.end(), 16, 0);
    expect(BitPacker::decode(with_nul) == "OK", "trailing NUL bytes are trimmed");

    // A partial trailing byte padded to NUL disappears as well.
    std::vector<uint8_t> ragged = test_utils::text_bits("A");
    ragged.push_back(0);
    ragged.push_back(0);
    expect(BitPacker::decode(ragged) == "A", "zero padding byte is trimmed");

    // Multi-byte sequences are accepted.
    const std::string utf8 = "\xE3\x81\x93\xE3\x82\x93 \xF0\x9F\x8E\xB5";
    expect(BitPacker::decode(test_utils::text_bits(utf8)) == utf8, "multi-byte UTF-8 survives");

    // Structurally broken sequences fall back to hex.
    expect(BitPacker::decode(BitPacker::unpack(std::vector<uint8_t>{0xC0, 0xAF})) ==
               "[HEX] C0 AF",
           "overlong encoding is rejected");
    expect(BitPacker::decode(BitPacker::unpack(std::vector<uint8_t>{0x41, 0xE3, 0x81})) ==
               "[HEX] 41 E3 81",
           "truncated sequence is rejected");
    expect(BitPacker::decode(BitPacker::unpack(std::vector<uint8_t>{0xED, 0xA0, 0x80})) ==
               "[HEX] ED A0 80",
           "surrogate code point is rejected");
    expect(BitPacker::decode(BitPacker::unpack(std::vector<uint8_t>{0xF4, 0x90, 0x80, 0x80})) ==
               "[HEX] F4 90 80 80",
           "code point above U+10FFFF is rejected");

    // The hex fallback keeps trailing NULs so nothing of the payload is lost.
    expect(BitPacker::decode(BitPacker::unpack(std::vector<uint8_t>{0xFF, 0x00})) ==
               "[HEX] FF 00",
           "hex fallback lists every packed byte");

    expect(BitPacker::decode({0, 0, 0, 0, 0, 0, 0, 0}).empty(), "all-zero frame decodes empty");
    expect(BitPacker::to_hex({0x0A, 0xB0}) == "0A B0", "hex digits are zero padded");

    return test_utils::finish("BitPacker");
}
