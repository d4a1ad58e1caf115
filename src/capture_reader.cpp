#include "capture_reader.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

CaptureReader::CaptureReader(std::size_t chunk_size) : chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("capture chunk size must be positive");
    }
}

void CaptureReader::reset() {
    read_cursor_ = 0;
    warned_invalid_cursor_ = false;
}

std::size_t CaptureReader::available(std::size_t write_cursor,
                                     std::size_t read_cursor,
                                     std::size_t capacity) {
    if (write_cursor >= read_cursor) {
        return write_cursor - read_cursor;
    }
    return (capacity - read_cursor) + write_cursor;
}

std::size_t CaptureReader::poll(CaptureDevice& device, std::vector<double>& out) {
    long write_pos = device.write_position();
    if (write_pos < 0) return 0;

    std::size_t capacity = device.capacity();
    if (capacity == 0 || static_cast<std::size_t>(write_pos) >= capacity) {
        if (!warned_invalid_cursor_) {
            std::cerr << "[TBSK] Warning: write cursor " << write_pos
                      << " outside store of " << capacity << " samples\n";
            warned_invalid_cursor_ = true;
        }
        return 0;
    }
    if (read_cursor_ >= capacity) read_cursor_ %= capacity;

    std::size_t wanted = std::min(available(static_cast<std::size_t>(write_pos), read_cursor_, capacity),
                                  chunk_size_);
    if (wanted == 0) return 0;

    std::size_t first = std::min(wanted, capacity - read_cursor_);
    std::size_t got = read_span(device, read_cursor_, first, out);
    if (got == first && wanted > first) {
        got += read_span(device, 0, wanted - first, out);
    }

    read_cursor_ = (read_cursor_ + got) % capacity;
    return got;
}

std::size_t CaptureReader::read_span(CaptureDevice& device, std::size_t from, std::size_t count,
                                     std::vector<double>& out) {
    const SampleFormat format = device.format();
    scratch_.resize(count * bytes_per_sample(format));
    std::size_t got = std::min(device.read(scratch_.data(), from, count), count);
    normalize_samples(scratch_.data(), format, got, out);
    return got;
}
