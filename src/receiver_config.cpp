#include "receiver_config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void read_unsigned(const char* name, unsigned& out) {
    const char* value = env_value(name);
    if (!value) return;
    try {
        std::size_t pos = 0;
        unsigned long parsed = std::stoul(value, &pos);
        if (pos != std::string(value).size() || std::string(value)[0] == '-') {
            throw std::invalid_argument(name);
        }
        out = static_cast<unsigned>(parsed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + ": expected an unsigned integer, got \"" +
                                    value + "\"");
    }
}

void read_double(const char* name, double& out) {
    const char* value = env_value(name);
    if (!value) return;
    try {
        std::size_t pos = 0;
        double parsed = std::stod(value, &pos);
        if (pos != std::string(value).size()) {
            throw std::invalid_argument(name);
        }
        out = parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string(name) + ": expected a number, got \"" + value +
                                    "\"");
    }
}

void read_bool(const char* name, bool& out) {
    const char* value = env_value(name);
    if (!value) return;
    std::string v(value);
    if (v == "1" || v == "true" || v == "on" || v == "yes") {
        out = true;
    } else if (v == "0" || v == "false" || v == "off" || v == "no") {
        out = false;
    } else {
        throw std::invalid_argument(std::string(name) + ": expected a boolean, got \"" + v + "\"");
    }
}

void read_string(const char* name, std::string& out) {
    const char* value = env_value(name);
    if (value) out = value;
}

} // namespace

TriggerConfig ReceiverConfig::trigger() const {
    TriggerConfig t;
    t.sample_rate = sample_rate;
    t.decode_on_silence = decode_on_silence;
    t.silence_rms_threshold = silence_rms_threshold;
    t.silence_hold_time = silence_hold_time;
    t.min_buffer_seconds = min_buffer_seconds;
    t.decode_threshold_seconds = decode_threshold_seconds;
    return t;
}

void apply_env_overrides(ReceiverConfig& cfg) {
    read_unsigned("TBSKRX_SAMPLE_RATE", cfg.sample_rate);
    read_unsigned("TBSKRX_RING_BUFFER_SECONDS", cfg.ring_buffer_seconds);
    read_unsigned("TBSKRX_PROCESS_CHUNK_SIZE", cfg.process_chunk_size);
    read_double("TBSKRX_DECODE_THRESHOLD_SECONDS", cfg.decode_threshold_seconds);
    read_bool("TBSKRX_USE_ASYNC_DECODE", cfg.use_async_decode);
    read_bool("TBSKRX_DECODE_ON_SILENCE", cfg.decode_on_silence);
    read_double("TBSKRX_SILENCE_RMS_THRESHOLD", cfg.silence_rms_threshold);
    read_double("TBSKRX_SILENCE_HOLD_TIME", cfg.silence_hold_time);
    read_double("TBSKRX_MIN_BUFFER_SECONDS", cfg.min_buffer_seconds);
    read_string("TBSKRX_DEVICE", cfg.device);
    read_bool("TBSKRX_DEBUG", cfg.show_debug_info);
    read_unsigned("TBSKRX_TICK_INTERVAL_MS", cfg.tick_interval_ms);
    read_string("TBSKRX_DEMOD_COMMAND", cfg.demod_command);

    if (const char* policy = env_value("TBSKRX_STOP_FLUSH_POLICY")) {
        cfg.stop_flush_policy = parse_stop_flush_policy(policy);
    }
}

void validate_config(const ReceiverConfig& cfg) {
    if (cfg.sample_rate == 0) {
        throw std::invalid_argument("sample rate must be positive");
    }
    if (cfg.ring_buffer_seconds == 0) {
        throw std::invalid_argument("ring buffer must hold at least one second");
    }
    if (cfg.process_chunk_size == 0) {
        throw std::invalid_argument("process chunk size must be positive");
    }
    if (cfg.process_chunk_size > cfg.ring_capacity()) {
        throw std::invalid_argument("process chunk size exceeds the ring buffer");
    }
    if (cfg.decode_threshold_seconds <= 0.0) {
        throw std::invalid_argument("decode threshold must be positive");
    }
    if (cfg.silence_rms_threshold < 0.0 || cfg.silence_hold_time < 0.0 ||
        cfg.min_buffer_seconds < 0.0) {
        throw std::invalid_argument("silence trigger settings must not be negative");
    }
    if (cfg.tick_interval_ms == 0) {
        throw std::invalid_argument("tick interval must be positive");
    }
}

StopFlushPolicy parse_stop_flush_policy(const std::string& value) {
    if (value == "discard") return StopFlushPolicy::Discard;
    if (value == "wait") return StopFlushPolicy::WaitAndDecode;
    throw std::invalid_argument("unknown stop flush policy \"" + value +
                                "\" (expected discard or wait)");
}

const char* to_string(StopFlushPolicy policy) {
    switch (policy) {
    case StopFlushPolicy::Discard: return "discard";
    case StopFlushPolicy::WaitAndDecode: return "wait";
    }
    return "unknown";
}
