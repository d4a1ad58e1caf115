#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

enum class SampleFormat {
    U8,   // unsigned 8-bit, 128 = silence
    S16,  // signed 16-bit little endian
    F32,  // 32-bit float, already in [-1, 1]
};

std::size_t bytes_per_sample(SampleFormat format);

// Appends `count` samples from `raw` to `out`, converted to [-1, 1].
void normalize_samples(const std::uint8_t* raw,
                       SampleFormat format,
                       std::size_t count,
                       std::vector<double>& out);

class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Capture source exposing a circular sample store.
//
// The device owns a store of capacity() samples and keeps writing into it,
// wrapping to index 0. Readers track their own cursor and compare it against
// write_position() to find unread samples.
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    // Throws DeviceError if the device cannot be opened or started.
    virtual void open(const std::string& device,
                      unsigned channels,
                      unsigned sample_rate,
                      std::size_t capacity) = 0;

    // Index the device will write next, or negative while not ready.
    virtual long write_position() const = 0;

    virtual std::size_t capacity() const = 0;
    virtual SampleFormat format() const = 0;

    // Rate the device actually runs at after open(); may differ from the
    // requested one.
    virtual unsigned sample_rate() const = 0;

    // Copies up to `count` samples starting at `from` into `out`, which must
    // hold count * bytes_per_sample(format()) bytes. A read never crosses the
    // physical end of the store.
    virtual std::size_t read(std::uint8_t* out, std::size_t from, std::size_t count) = 0;

    virtual void close() = 0;
};
