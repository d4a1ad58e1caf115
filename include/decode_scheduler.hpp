#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Demodulator;
class SharedAudioBuffer;

struct DecodeStats {
    uint64_t accepted = 0;   // jobs snapshotted and run
    uint64_t dropped = 0;    // triggers refused because a job was outstanding
    uint64_t failed = 0;     // jobs whose demodulator threw
    uint64_t empty = 0;      // jobs with no frame or an empty message
    uint64_t delivered = 0;  // messages handed to the sink
};

// Runs demodulation off the capture path, one job at a time.
//
// A job is the buffer's contents at trigger time. While one is outstanding
// further requests are dropped and counted, never queued. The in-progress
// flag is cleared before the result is published, so the sink may trigger the
// next decode.
class DecodeScheduler {
public:
    using MessageCallback = std::function<void(const std::string&)>;

    // With `async` set, jobs run on a dedicated worker thread; otherwise on
    // the caller. `on_message` is invoked on whichever thread ran the job.
    DecodeScheduler(Demodulator& demodulator, MessageCallback on_message, bool async);

    // Waits for an outstanding job, then joins the worker.
    ~DecodeScheduler();

    DecodeScheduler(const DecodeScheduler&) = delete;
    DecodeScheduler& operator=(const DecodeScheduler&) = delete;

    // Snapshots and clears `buffer` and dispatches the job. Returns false if
    // the request was dropped or the buffer was empty.
    bool request(SharedAudioBuffer& buffer);

    // Same single-flight rules, but always runs on the calling thread.
    bool decode_now(SharedAudioBuffer& buffer);

    bool busy() const { return decoding_.load(); }

    // Blocks until no job is outstanding.
    void wait_idle();

    DecodeStats stats() const;
    void reset_stats();

private:
    bool submit(SharedAudioBuffer& buffer, bool async);
    void run_job(std::vector<double> samples);
    void worker_loop();

    Demodulator& demodulator_;
    MessageCallback on_message_;
    bool async_;

    std::atomic<bool> decoding_{false};

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> empty_{0};
    std::atomic<uint64_t> delivered_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::vector<double> pending_;
    bool has_pending_{false};
    bool running_{true};
    std::thread worker_;
};
