#include "bit_packer.hpp"

#include <cstddef>
#include <cstdio>

std::vector<uint8_t> BitPacker::pack(const std::vector<uint8_t>& bits) {
    std::vector<uint8_t> bytes((bits.size() + 7) / 8, 0);
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] & 1) {
            bytes[i / 8] |= static_cast<uint8_t>(0x80u >> (i % 8));
        }
    }
    return bytes;
}

std::vector<uint8_t> BitPacker::unpack(const std::vector<uint8_t>& bytes) {
    std::vector<uint8_t> bits;
    bits.reserve(bytes.size() * 8);
    for (uint8_t b : bytes) {
        for (int i = 7; i >= 0; --i) {
            bits.push_back(static_cast<uint8_t>((b >> i) & 1));
        }
    }
    return bits;
}

std::vector<uint8_t> BitPacker::unpack(const std::string& text) {
    return unpack(std::vector<uint8_t>(text.begin(), text.end()));
}

bool BitPacker::is_valid_utf8(const uint8_t* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size) {
        uint8_t lead = data[i];
        std::size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
            min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
            min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
            min_cp = 0x10000;
        } else {
            return false;
        }

        if (size - i <= extra) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (cp < min_cp) return false;                    // overlong
        if (cp > 0x10FFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;   // surrogate
        i += extra + 1;
    }
    return true;
}

std::string BitPacker::to_hex(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    char digits[3];
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) out.push_back(' ');
        std::snprintf(digits, sizeof(digits), "%02X", bytes[i]);
        out.append(digits, 2);
    }
    return out;
}

std::string BitPacker::decode(const std::vector<uint8_t>& bits) {
    std::vector<uint8_t> bytes = pack(bits);

    std::size_t length = bytes.size();
    while (length > 0 && bytes[length - 1] == 0x00) {
        --length;
    }

    if (is_valid_utf8(bytes.data(), length)) {
        return std::string(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
    }
    return std::string(kHexPrefix) + to_hex(bytes);
}
