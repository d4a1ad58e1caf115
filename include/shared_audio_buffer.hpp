#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

class RmsTracker;

// Samples captured since the last decode snapshot.
//
// Written by the tick path and drained by the decode scheduler; every member
// takes the same mutex for the duration of a single append or copy.
class SharedAudioBuffer {
public:
    // Appends samples and feeds each one to `rms` inside the same critical
    // section.
    void append(const std::vector<double>& samples, RmsTracker& rms);
    void append(const std::vector<double>& samples);

    // If `busy` was clear, sets it, moves the contents into `out` and empties
    // the buffer. Returns false, leaving everything untouched, if `busy` was
    // already set.
    bool snapshot_and_clear(std::atomic<bool>& busy, std::vector<double>& out);

    void clear();
    std::size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::vector<double> samples_;
};
