#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Recovers a bit stream from normalized audio samples.
//
// demodulate() is called from the decode worker thread, never concurrently
// with itself. An empty result means no valid frame was found; malformed input
// is reported by throwing.
class Demodulator {
public:
    virtual ~Demodulator() = default;
    virtual std::vector<uint8_t> demodulate(const std::vector<double>& samples) = 0;
};
