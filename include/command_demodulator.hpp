#pragma once

#include "demodulator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Runs an external demodulator program once per decode job.
//
// The samples are written as raw little-endian float32 to a temporary file
// whose path is appended to `command` as its last argument. Every '0' and '1'
// the program prints on stdout becomes a bit; other characters are ignored.
// A non-zero exit status raises DecodeError.
class CommandDemodulator : public Demodulator {
public:
    CommandDemodulator(const std::string& command, unsigned sample_rate);
    ~CommandDemodulator() override;

    std::vector<uint8_t> demodulate(const std::vector<double>& samples) override;

    static std::vector<uint8_t> parse_bits(const std::string& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
