#include "decode_scheduler.hpp"

#include "bit_packer.hpp"
#include "demodulator.hpp"
#include "shared_audio_buffer.hpp"

#include <exception>
#include <iostream>
#include <utility>

DecodeScheduler::DecodeScheduler(Demodulator& demodulator, MessageCallback on_message, bool async)
    : demodulator_(demodulator), on_message_(std::move(on_message)), async_(async) {
    if (async_) {
        worker_ = std::thread(&DecodeScheduler::worker_loop, this);
    }
}

DecodeScheduler::~DecodeScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool DecodeScheduler::request(SharedAudioBuffer& buffer) {
    return submit(buffer, async_);
}

bool DecodeScheduler::decode_now(SharedAudioBuffer& buffer) {
    return submit(buffer, false);
}

bool DecodeScheduler::submit(SharedAudioBuffer& buffer, bool async) {
    std::vector<double> job;
    if (!buffer.snapshot_and_clear(decoding_, job)) {
        ++dropped_;
        return false;
    }

    if (job.empty()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            decoding_.store(false);
        }
        idle_cv_.notify_all();
        return false;
    }

    ++accepted_;
    if (!async) {
        run_job(std::move(job));
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::move(job);
        has_pending_ = true;
    }
    cv_.notify_one();
    return true;
}

void DecodeScheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [&] { return has_pending_ || !running_; });
        if (has_pending_) {
            std::vector<double> job = std::move(pending_);
            pending_.clear();
            has_pending_ = false;
            lock.unlock();
            run_job(std::move(job));
            lock.lock();
            continue;
        }
        if (!running_) break;
    }
}

void DecodeScheduler::run_job(std::vector<double> samples) {
    std::string message;
    bool failed = false;
    try {
        std::vector<uint8_t> bits = demodulator_.demodulate(samples);
        if (!bits.empty()) {
            message = BitPacker::decode(bits);
        }
    } catch (const std::exception& e) {
        std::cerr << "[TBSK] Warning: decode of " << samples.size()
                  << " samples failed: " << e.what() << "\n";
        failed = true;
        message.clear();
    } catch (...) {
        std::cerr << "[TBSK] Warning: decode of " << samples.size()
                  << " samples failed: unknown error\n";
        failed = true;
        message.clear();
    }

    if (failed) {
        ++failed_;
    } else if (message.empty()) {
        ++empty_;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        decoding_.store(false);
    }
    idle_cv_.notify_all();

    if (message.empty()) return;

    std::cout << "[DECODED] " << message << "\n";
    ++delivered_;
    if (!on_message_) return;
    try {
        on_message_(message);
    } catch (const std::exception& e) {
        std::cerr << "[TBSK] Warning: message sink failed: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[TBSK] Warning: message sink failed: unknown error\n";
    }
}

void DecodeScheduler::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [&] { return !decoding_.load(); });
}

DecodeStats DecodeScheduler::stats() const {
    DecodeStats s;
    s.accepted = accepted_.load();
    s.dropped = dropped_.load();
    s.failed = failed_.load();
    s.empty = empty_.load();
    s.delivered = delivered_.load();
    return s;
}

void DecodeScheduler::reset_stats() {
    accepted_ = 0;
    dropped_ = 0;
    failed_ = 0;
    empty_ = 0;
    delivered_ = 0;
}
