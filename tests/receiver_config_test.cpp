#include "receiver_config.hpp"
#include "test_utils.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using test_utils::expect;

namespace {

template <typename Fn>
bool throws_invalid(Fn fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_defaults() {
    ReceiverConfig cfg;
    expect(cfg.sample_rate == 8000, "default sample rate");
    expect(cfg.ring_buffer_seconds == 2, "default ring length");
    expect(cfg.process_chunk_size == 800, "default chunk size");
    expect(cfg.decode_threshold_seconds == 0.5, "default decode threshold");
    expect(cfg.use_async_decode, "async decode on by default");
    expect(cfg.decode_on_silence, "silence trigger on by default");
    expect(cfg.silence_rms_threshold == 0.2, "default silence threshold");
    expect(cfg.silence_hold_time == 0.4, "default hold time");
    expect(cfg.min_buffer_seconds == 0.8, "default minimum buffer");
    expect(cfg.stop_flush_policy == StopFlushPolicy::Discard, "tail discarded by default");
    expect(cfg.ring_capacity() == 16000, "ring capacity in samples");

    TriggerConfig t = cfg.trigger();
    expect(t.sample_rate == 8000 && t.decode_on_silence && t.silence_hold_time == 0.4,
           "trigger settings derived from the receiver config");

    bool valid = true;
    try {
        validate_config(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        valid = false;
    }
    expect(valid, "defaults validate");
}

void test_env_overrides() {
    setenv("TBSKRX_SAMPLE_RATE", "16000", 1);
    setenv("TBSKRX_PROCESS_CHUNK_SIZE", "1600", 1);
    setenv("TBSKRX_DECODE_ON_SILENCE", "off", 1);
    setenv("TBSKRX_SILENCE_HOLD_TIME", "0.25", 1);
    setenv("TBSKRX_DEVICE", "plughw:1,0", 1);
    setenv("TBSKRX_STOP_FLUSH_POLICY", "wait", 1);

    ReceiverConfig cfg;
    apply_env_overrides(cfg);
    expect(cfg.sample_rate == 16000, "sample rate from the environment");
    expect(cfg.process_chunk_size == 1600, "chunk size from the environment");
    expect(!cfg.decode_on_silence, "boolean override");
    expect(cfg.silence_hold_time == 0.25, "floating point override");
    expect(cfg.device == "plughw:1,0", "device override");
    expect(cfg.stop_flush_policy == StopFlushPolicy::WaitAndDecode, "flush policy override");
    expect(cfg.ring_capacity() == 32000, "capacity follows the sample rate");

    unsetenv("TBSKRX_SAMPLE_RATE");
    unsetenv("TBSKRX_PROCESS_CHUNK_SIZE");
    unsetenv("TBSKRX_DECODE_ON_SILENCE");
    unsetenv("TBSKRX_SILENCE_HOLD_TIME");
    unsetenv("TBSKRX_DEVICE");
    unsetenv("TBSKRX_STOP_FLUSH_POLICY");
}

void test_bad_env_values() {
    setenv("TBSKRX_SAMPLE_RATE", "fast", 1);
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               apply_env_overrides(cfg);
           }),
           "non-numeric rate rejected");
    setenv("TBSKRX_SAMPLE_RATE", "-8000", 1);
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               apply_env_overrides(cfg);
           }),
           "negative rate rejected");
    unsetenv("TBSKRX_SAMPLE_RATE");

    setenv("TBSKRX_MIN_BUFFER_SECONDS", "0.8s", 1);
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               apply_env_overrides(cfg);
           }),
           "trailing garbage rejected");
    unsetenv("TBSKRX_MIN_BUFFER_SECONDS");

    setenv("TBSKRX_USE_ASYNC_DECODE", "maybe", 1);
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               apply_env_overrides(cfg);
           }),
           "unknown boolean rejected");
    unsetenv("TBSKRX_USE_ASYNC_DECODE");

    expect(throws_invalid([] { parse_stop_flush_policy("queue"); }), "unknown policy rejected");
    expect(std::string(to_string(StopFlushPolicy::WaitAndDecode)) == "wait", "policy names");
}

void test_validation() {
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               cfg.sample_rate = 0;
               validate_config(cfg);
           }),
           "zero sample rate rejected");
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               cfg.process_chunk_size = 0;
               validate_config(cfg);
           }),
           "zero chunk rejected");
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               cfg.process_chunk_size = 20000;
               validate_config(cfg);
           }),
           "chunk larger than the ring rejected");
    expect(throws_invalid([] {
               ReceiverConfig cfg;
               cfg.silence_hold_time = -1.0;
               validate_config(cfg);
           }),
           "negative hold time rejected");
}

} // namespace

int main() {
    std::cout << "=== Testing ReceiverConfig ===" << std::endl;

    test_defaults();
    test_env_overrides();
    test_bad_env_values();
    test_validation();

    return test_utils::finish("ReceiverConfig");
}
