#pragma once

#include <cstddef>

struct TriggerConfig {
    unsigned sample_rate = 8000;
    bool decode_on_silence = true;
    double silence_rms_threshold = 0.2;
    double silence_hold_time = 0.4;      // seconds below threshold before firing
    double min_buffer_seconds = 0.8;     // silence mode
    double decode_threshold_seconds = 0.5; // buffered-duration mode
};

// Decides when the buffered audio should be handed to the decoder.
//
// In silence mode the trigger fires once the RMS has stayed below the
// threshold for silence_hold_time and at least min_buffer_seconds of audio is
// buffered. Otherwise it fires as soon as decode_threshold_seconds of audio is
// buffered.
class SilenceTrigger {
public:
    explicit SilenceTrigger(const TriggerConfig& cfg);

    bool evaluate(double rms, double elapsed_seconds, std::size_t buffered_samples);
    void reset();

    double silence_time() const { return static_cast<double>(silence_micros_) / 1e6; }
    bool silence_mode() const { return cfg_.decode_on_silence; }

private:
    TriggerConfig cfg_;
    std::size_t min_buffer_samples_;
    std::size_t threshold_samples_;
    // Whole microseconds, so a run of equal tick deltas sums exactly.
    long long hold_micros_;
    long long silence_micros_{0};
};
