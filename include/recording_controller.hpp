#pragma once

#include "capture_device.hpp"
#include "capture_reader.hpp"
#include "decode_scheduler.hpp"
#include "receiver_config.hpp"
#include "rms_tracker.hpp"
#include "shared_audio_buffer.hpp"
#include "silence_trigger.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class Demodulator;

// Microphone-to-message receiver.
//
// Owns the capture device and the decode pipeline. start(), stop() and tick()
// must be called from one thread, the driver; tick() is expected at a fixed
// cadence with the time elapsed since the previous call.
//
// Message listeners run on the decode worker for asynchronous decodes and on
// the driver thread for synchronous ones (including the flush in stop()).
// Listeners that touch thread-affine state must marshal the call themselves.
class RecordingController {
public:
    enum class State { Idle, Recording };

    using MessageListener = std::function<void(const std::string&)>;

    RecordingController(const ReceiverConfig& cfg,
                        std::unique_ptr<CaptureDevice> device,
                        std::unique_ptr<Demodulator> demodulator);
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    // Throws DeviceError if the device cannot be opened or runs at a rate
    // other than cfg.sample_rate; the controller stays Idle in that case.
    void start();
    void stop();
    void tick(double elapsed_seconds);

    void add_message_listener(MessageListener listener);

    State state() const { return state_; }
    bool is_recording() const { return state_ == State::Recording; }
    bool is_decoding() const { return scheduler_->busy(); }
    double current_rms() const { return current_rms_.load(); }
    std::size_t buffered_samples() const { return buffer_.size(); }
    std::string last_decoded_message() const;
    DecodeStats stats() const { return scheduler_->stats(); }

    const ReceiverConfig& config() const { return cfg_; }

private:
    void process_tick(double elapsed_seconds);
    void flush_tail();
    void publish(const std::string& message);
    void log_debug_stats(double elapsed_seconds);

    ReceiverConfig cfg_;
    std::unique_ptr<CaptureDevice> device_;
    std::unique_ptr<Demodulator> demodulator_;

    CaptureReader reader_;
    SharedAudioBuffer buffer_;
    RmsTracker rms_;
    SilenceTrigger trigger_;

    State state_{State::Idle};
    std::atomic<double> current_rms_{0.0};
    std::vector<double> chunk_;

    std::size_t samples_since_report_{0};
    double report_timer_{0.0};

    mutable std::mutex listeners_mutex_;
    std::vector<MessageListener> listeners_;
    std::string last_message_;

    // Declared last: its worker must stop before the members above go away.
    std::unique_ptr<DecodeScheduler> scheduler_;
};

const char* to_string(RecordingController::State state);
