#pragma once

#include "capture_device.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Drains a CaptureDevice's circular store, at most chunk_size samples a call.
class CaptureReader {
public:
    explicit CaptureReader(std::size_t chunk_size);

    void reset();

    // Appends newly written samples, normalized, to `out` and advances the
    // read cursor. Returns the number of samples appended; 0 when the device
    // is not ready yet.
    std::size_t poll(CaptureDevice& device, std::vector<double>& out);

    std::size_t cursor() const { return read_cursor_; }

    static std::size_t available(std::size_t write_cursor,
                                 std::size_t read_cursor,
                                 std::size_t capacity);

private:
    std::size_t read_span(CaptureDevice& device, std::size_t from, std::size_t count,
                          std::vector<double>& out);

    std::size_t chunk_size_;
    std::size_t read_cursor_{0};
    bool warned_invalid_cursor_{false};
    std::vector<std::uint8_t> scratch_;
};
