#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Turns demodulated bits into a message string.
//
// Bits are MSB first, 8 per byte; a trailing partial byte is padded with
// zero bits. Trailing NUL bytes are dropped and the rest is returned as text
// when it is valid UTF-8. Anything else comes back as "[HEX] " followed by
// the packed bytes in uppercase hex, space separated.
class BitPacker {
public:
    static std::vector<uint8_t> pack(const std::vector<uint8_t>& bits);
    static std::vector<uint8_t> unpack(const std::vector<uint8_t>& bytes);
    static std::vector<uint8_t> unpack(const std::string& text);

    static std::string decode(const std::vector<uint8_t>& bits);

    static bool is_valid_utf8(const uint8_t* data, std::size_t size);
    static std::string to_hex(const std::vector<uint8_t>& bytes);

    static constexpr const char* kHexPrefix = "[HEX] ";
};
