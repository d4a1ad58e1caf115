#pragma once

#include "capture_device.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct AudioConfig {
    unsigned frames_per_period = 256;  // frames per ALSA read on the capture thread
};

// ALSA microphone exposed as a CaptureDevice.
//
// A background thread reads S16 periods from the PCM and copies them into a
// circular store of the capacity passed to open().
class AudioCapture : public CaptureDevice {
public:
    explicit AudioCapture(const AudioConfig& cfg = AudioConfig());
    ~AudioCapture() override;

    void open(const std::string& device,
              unsigned channels,
              unsigned sample_rate,
              std::size_t capacity) override;
    long write_position() const override;
    std::size_t capacity() const override;
    SampleFormat format() const override { return SampleFormat::S16; }
    std::size_t read(std::uint8_t* out, std::size_t from, std::size_t count) override;
    void close() override;
    unsigned sample_rate() const override;

    static void list_devices();

private:
    struct Impl;
    Impl* impl_;
};
