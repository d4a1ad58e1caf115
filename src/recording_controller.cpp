#include "recording_controller.hpp"

#include "demodulator.hpp"
#include "utils.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

RecordingController::RecordingController(const ReceiverConfig& cfg,
                                         std::unique_ptr<CaptureDevice> device,
                                         std::unique_ptr<Demodulator> demodulator)
    : cfg_(cfg),
      device_(std::move(device)),
      demodulator_(std::move(demodulator)),
      reader_(cfg.process_chunk_size),
      rms_(RmsTracker::window_for_rate(cfg.sample_rate)),
      trigger_(cfg.trigger()) {
    if (!device_) {
        throw std::invalid_argument("RecordingController requires a capture device");
    }
    if (!demodulator_) {
        throw std::invalid_argument("RecordingController requires a demodulator");
    }
    scheduler_ = std::make_unique<DecodeScheduler>(
        *demodulator_, [this](const std::string& message) { publish(message); },
        cfg_.use_async_decode);
}

RecordingController::~RecordingController() {
    if (state_ == State::Recording) {
        device_->close();
        state_ = State::Idle;
    }
    scheduler_.reset();
}

void RecordingController::start() {
    if (state_ == State::Recording) return;

    try {
        device_->open(cfg_.device, 1, cfg_.sample_rate, cfg_.ring_capacity());
    } catch (const DeviceError& e) {
        device_->close();
        std::cerr << "[TBSK] Failed to start recording: " << e.what() << "\n";
        throw;
    }

    // RMS window, trigger sample counts and the demodulator all assume the
    // configured rate.
    unsigned actual_rate = device_->sample_rate();
    if (actual_rate != cfg_.sample_rate) {
        device_->close();
        std::string what = "device " + cfg_.device + " runs at " + std::to_string(actual_rate) +
                           " Hz, configured for " + std::to_string(cfg_.sample_rate) + " Hz";
        std::cerr << "[TBSK] Failed to start recording: " << what << "\n";
        throw DeviceError(what);
    }

    reader_.reset();
    buffer_.clear();
    rms_.reset();
    trigger_.reset();
    current_rms_.store(0.0);
    samples_since_report_ = 0;
    report_timer_ = 0.0;
    scheduler_->reset_stats();

    state_ = State::Recording;
    std::cout << "[TBSK] Started recording from " << cfg_.device << " at " << cfg_.sample_rate
              << " Hz (" << (cfg_.decode_on_silence ? "silence" : "threshold") << " trigger, "
              << (cfg_.use_async_decode ? "async" : "sync") << " decode)\n";
}

void RecordingController::stop() {
    if (state_ != State::Recording) return;

    device_->close();
    state_ = State::Idle;
    flush_tail();
    std::cout << "[TBSK] Stopped recording\n";
}

void RecordingController::flush_tail() {
    if (buffer_.empty()) return;

    if (scheduler_->busy()) {
        if (cfg_.stop_flush_policy == StopFlushPolicy::Discard) {
            std::cout << "[TBSK] Decode in progress, discarding " << buffer_.size()
                      << " buffered samples\n";
            buffer_.clear();
            return;
        }
        scheduler_->wait_idle();
    }

    if (!scheduler_->decode_now(buffer_)) {
        buffer_.clear();
    }
}

void RecordingController::tick(double elapsed_seconds) {
    if (state_ != State::Recording) return;

    try {
        process_tick(elapsed_seconds);
    } catch (const std::exception& e) {
        std::cerr << "[TBSK] Warning: capture tick failed: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[TBSK] Warning: capture tick failed: unknown error\n";
    }
}

void RecordingController::process_tick(double elapsed_seconds) {
    chunk_.clear();
    std::size_t got = reader_.poll(*device_, chunk_);
    if (got > 0) {
        buffer_.append(chunk_, rms_);
        samples_since_report_ += got;
    }

    double level = rms_.current_rms();
    current_rms_.store(level);

    if (cfg_.show_debug_info) {
        log_debug_stats(elapsed_seconds);
    }

    if (scheduler_->busy()) return;

    if (trigger_.evaluate(level, elapsed_seconds, buffer_.size())) {
        scheduler_->request(buffer_);
    }
}

void RecordingController::log_debug_stats(double elapsed_seconds) {
    report_timer_ += elapsed_seconds;
    if (report_timer_ < 1.0) return;

    double level = current_rms_.load();
    std::ostringstream line;
    line << "[TBSK] Processed " << samples_since_report_ << " samples/sec, Buffer: "
         << buffer_.size() << ", RMS: " << std::fixed << std::setprecision(3) << level << " ("
         << std::setprecision(1) << dbfs(level) << " dBFS)\n";
    std::cout << line.str();
    samples_since_report_ = 0;
    report_timer_ = 0.0;
}

void RecordingController::add_message_listener(MessageListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

std::string RecordingController::last_decoded_message() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return last_message_;
}

void RecordingController::publish(const std::string& message) {
    std::vector<MessageListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        last_message_ = message;
        listeners = listeners_;
    }

    for (auto& listener : listeners) {
        try {
            listener(message);
        } catch (const std::exception& e) {
            std::cerr << "[TBSK] Warning: message listener failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[TBSK] Warning: message listener failed: unknown error\n";
        }
    }
}

const char* to_string(RecordingController::State state) {
    switch (state) {
    case RecordingController::State::Idle: return "Idle";
    case RecordingController::State::Recording: return "Recording";
    }
    return "unknown";
}
