#include "capture_device.hpp"

#include <cstring>

std::size_t bytes_per_sample(SampleFormat format) {
    switch (format) {
    case SampleFormat::U8: return 1;
    case SampleFormat::S16: return 2;
    case SampleFormat::F32: return 4;
    }
    return 0;
}

void normalize_samples(const std::uint8_t* raw,
                       SampleFormat format,
                       std::size_t count,
                       std::vector<double>& out) {
    out.reserve(out.size() + count);
    switch (format) {
    case SampleFormat::U8:
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back((static_cast<double>(raw[i]) - 128.0) / 128.0);
        }
        break;
    case SampleFormat::S16:
        for (std::size_t i = 0; i < count; ++i) {
            auto value = static_cast<int16_t>(raw[2 * i] | (raw[2 * i + 1] << 8));
            out.push_back(static_cast<double>(value) / 32768.0);
        }
        break;
    case SampleFormat::F32:
        for (std::size_t i = 0; i < count; ++i) {
            float value = 0.0f;
            std::memcpy(&value, raw + 4 * i, sizeof(value));
            double sample = static_cast<double>(value);
            if (sample > 1.0) sample = 1.0;
            if (sample < -1.0) sample = -1.0;
            out.push_back(sample);
        }
        break;
    }
}
