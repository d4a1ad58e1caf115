#include "silence_trigger.hpp"

#include <cmath>

namespace {

long long to_micros(double seconds) {
    return std::llround(seconds * 1e6);
}

} // namespace

SilenceTrigger::SilenceTrigger(const TriggerConfig& cfg)
    : cfg_(cfg),
      min_buffer_samples_(static_cast<std::size_t>(cfg.sample_rate * cfg.min_buffer_seconds)),
      threshold_samples_(static_cast<std::size_t>(cfg.sample_rate * cfg.decode_threshold_seconds)),
      hold_micros_(to_micros(cfg.silence_hold_time)) {}

bool SilenceTrigger::evaluate(double rms, double elapsed_seconds, std::size_t buffered_samples) {
    if (!cfg_.decode_on_silence) {
        return buffered_samples > 0 && buffered_samples >= threshold_samples_;
    }

    if (rms < cfg_.silence_rms_threshold) {
        silence_micros_ += to_micros(elapsed_seconds);
    } else {
        silence_micros_ = 0;
    }

    if (silence_micros_ >= hold_micros_ && buffered_samples >= min_buffer_samples_) {
        silence_micros_ = 0;
        return true;
    }
    return false;
}

void SilenceTrigger::reset() {
    silence_micros_ = 0;
}
