#pragma once

#include "silence_trigger.hpp"

#include <cstddef>
#include <string>

// What stop() does with buffered samples while a decode is still running.
enum class StopFlushPolicy {
    Discard,      // drop the tail
    WaitAndDecode // wait for the running job, then decode the tail
};

struct ReceiverConfig {
    unsigned sample_rate = 8000;
    unsigned ring_buffer_seconds = 2;        // device store length
    unsigned process_chunk_size = 800;       // samples read per tick (0.1 s)
    double decode_threshold_seconds = 0.5;   // used when decode_on_silence is off
    bool use_async_decode = true;

    bool decode_on_silence = true;
    double silence_rms_threshold = 0.2;
    double silence_hold_time = 0.4;
    double min_buffer_seconds = 0.8;

    std::string device = "default";          // ALSA device name
    bool show_debug_info = false;
    StopFlushPolicy stop_flush_policy = StopFlushPolicy::Discard;

    // Used by the command line driver only.
    unsigned tick_interval_ms = 20;
    std::string demod_command;

    std::size_t ring_capacity() const {
        return static_cast<std::size_t>(sample_rate) * ring_buffer_seconds;
    }

    TriggerConfig trigger() const;
};

// Applies TBSKRX_* environment variables on top of `cfg`. Throws
// std::invalid_argument naming the variable when a value does not parse.
void apply_env_overrides(ReceiverConfig& cfg);

// Throws std::invalid_argument when the values cannot drive a receiver.
void validate_config(const ReceiverConfig& cfg);

StopFlushPolicy parse_stop_flush_policy(const std::string& value);
const char* to_string(StopFlushPolicy policy);
