#include "shared_audio_buffer.hpp"

#include "rms_tracker.hpp"

void SharedAudioBuffer::append(const std::vector<double>& samples, RmsTracker& rms) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.reserve(samples_.size() + samples.size());
    for (double sample : samples) {
        samples_.push_back(sample);
        rms.update(sample);
    }
}

void SharedAudioBuffer::append(const std::vector<double>& samples) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.insert(samples_.end(), samples.begin(), samples.end());
}

bool SharedAudioBuffer::snapshot_and_clear(std::atomic<bool>& busy, std::vector<double>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (busy.exchange(true)) return false;

    out.clear();
    out.swap(samples_);
    return true;
}

void SharedAudioBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

std::size_t SharedAudioBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

bool SharedAudioBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.empty();
}
