#include "audio_capture.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#if defined(__linux__)

#include <alsa/asoundlib.h>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

} // namespace

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig& cfg);
    ~Impl();

    void open(const std::string& device, unsigned channels, unsigned sample_rate,
              std::size_t capacity);
    long write_position() const { return write_pos_.load(); }
    std::size_t capacity() const { return ring_.size(); }
    std::size_t read(std::uint8_t* out, std::size_t from, std::size_t count);
    void close();
    unsigned sample_rate() const { return sample_rate_; }
    static void list_devices();

private:
    void configure(unsigned channels, unsigned sample_rate);
    void capture_loop();
    void store(const int16_t* frames, std::size_t count);

    AudioConfig cfg_;
    snd_pcm_t* handle_{nullptr};
    unsigned channels_{1};
    unsigned sample_rate_{0};

    std::mutex mutex_;
    std::vector<int16_t> ring_;
    std::size_t write_index_{0};
    std::atomic<long> write_pos_{-1};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

AudioCapture::Impl::Impl(const AudioConfig& cfg) : cfg_(cfg) {}

AudioCapture::Impl::~Impl() {
    close();
}

void AudioCapture::Impl::open(const std::string& device, unsigned channels, unsigned sample_rate,
                              std::size_t capacity) {
    if (handle_) return;
    if (capacity == 0) {
        throw DeviceError("capture store capacity must be positive");
    }

    int err = snd_pcm_open(&handle_, device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        throw DeviceError(alsa_error(err, "snd_pcm_open " + device));
    }

    try {
        configure(channels, sample_rate);
    } catch (...) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ring_.assign(capacity, 0);
        write_index_ = 0;
    }
    write_pos_.store(-1);
    running_ = true;
    thread_ = std::thread(&AudioCapture::Impl::capture_loop, this);
}

void AudioCapture::Impl::configure(unsigned channels, unsigned sample_rate) {
    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    if (!hw_params) {
        throw DeviceError("Failed to allocate ALSA hw params");
    }

    snd_pcm_hw_params_any(handle_, hw_params);

    int err = snd_pcm_hw_params_set_access(handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        throw DeviceError(alsa_error(err, "snd_pcm_hw_params_set_access"));
    }

    err = snd_pcm_hw_params_set_format(handle_, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        throw DeviceError(alsa_error(err, "snd_pcm_hw_params_set_format"));
    }

    err = snd_pcm_hw_params_set_channels(handle_, hw_params, channels);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        throw DeviceError(alsa_error(err, "snd_pcm_hw_params_set_channels"));
    }
    channels_ = channels;

    unsigned int rate = sample_rate;
    err = snd_pcm_hw_params_set_rate_near(handle_, hw_params, &rate, nullptr);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        throw DeviceError(alsa_error(err, "snd_pcm_hw_params_set_rate_near"));
    }
    if (rate != sample_rate) {
        std::cerr << "[TBSK] Warning: sample rate adjusted to " << rate << " Hz\n";
    }
    sample_rate_ = rate;

    snd_pcm_uframes_t frames = cfg_.frames_per_period;
    err = snd_pcm_hw_params_set_period_size_near(handle_, hw_params, &frames, nullptr);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        throw DeviceError(alsa_error(err, "snd_pcm_hw_params_set_period_size_near"));
    }
    cfg_.frames_per_period = static_cast<unsigned>(frames);

    err = snd_pcm_hw_params(handle_, hw_params);
    snd_pcm_hw_params_free(hw_params);
    if (err < 0) {
        throw DeviceError(alsa_error(err, "snd_pcm_hw_params"));
    }

    err = snd_pcm_prepare(handle_);
    if (err < 0) {
        throw DeviceError(alsa_error(err, "snd_pcm_prepare"));
    }
}

void AudioCapture::Impl::capture_loop() {
    std::vector<int16_t> period(static_cast<std::size_t>(cfg_.frames_per_period) * channels_);

    while (running_) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, period.data(), cfg_.frames_per_period);
        if (frames < 0) {
            frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        }
        if (frames < 0) {
            std::cerr << "[TBSK] " << alsa_error(static_cast<int>(frames), "snd_pcm_readi")
                      << ", capture stopped\n";
            running_ = false;
            break;
        }
        if (frames == 0) continue;

        // Keep the first channel only.
        std::size_t count = static_cast<std::size_t>(frames);
        if (channels_ > 1) {
            for (std::size_t i = 0; i < count; ++i) {
                period[i] = period[i * channels_];
            }
        }
        store(period.data(), count);
    }
}

void AudioCapture::Impl::store(const int16_t* frames, std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < count; ++i) {
        ring_[write_index_] = frames[i];
        write_index_ = (write_index_ + 1) % ring_.size();
    }
    write_pos_.store(static_cast<long>(write_index_));
}

std::size_t AudioCapture::Impl::read(std::uint8_t* out, std::size_t from, std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (from >= ring_.size()) return 0;

    std::size_t n = std::min(count, ring_.size() - from);
    for (std::size_t i = 0; i < n; ++i) {
        auto value = static_cast<uint16_t>(ring_[from + i]);
        out[2 * i] = static_cast<std::uint8_t>(value & 0xFF);
        out[2 * i + 1] = static_cast<std::uint8_t>(value >> 8);
    }
    return n;
}

void AudioCapture::Impl::close() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
    write_pos_.store(-1);
}

void AudioCapture::Impl::list_devices() {
    int card = -1;
    if (snd_card_next(&card) < 0 || card < 0) {
        std::cout << "No ALSA capture devices found.\n";
        return;
    }

    std::cout << "ALSA capture devices (use \"plughw:x,y\"):\n";
    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            snd_card_next(&card);
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (!pcm_info) {
            std::cout << "  (Failed to allocate pcm_info)\n";
            snd_ctl_close(ctl);
            snd_card_next(&card);
            continue;
        }

        int device = -1;
        while (true) {
            if (snd_ctl_pcm_next_device(ctl, &device) < 0) break;
            if (device < 0) break;

            snd_pcm_info_set_device(pcm_info, device);
            snd_pcm_info_set_subdevice(pcm_info, 0);
            snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);

            if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

            const char* name = snd_pcm_info_get_name(pcm_info);
            const char* id = snd_pcm_info_get_id(pcm_info);
            std::cout << "- hw:" << card << "," << device;
            if (name) std::cout << " (" << name << ")";
            if (id) std::cout << " [" << id << "]";
            std::cout << "\n";
        }

        snd_pcm_info_free(pcm_info);
        snd_ctl_close(ctl);
        snd_card_next(&card);
    }
}

#else

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig&) {}
    void open(const std::string&, unsigned, unsigned, std::size_t) {
        throw DeviceError("Audio capture not supported on this platform");
    }
    long write_position() const { return -1; }
    std::size_t capacity() const { return 0; }
    std::size_t read(std::uint8_t*, std::size_t, std::size_t) { return 0; }
    void close() {}
    unsigned sample_rate() const { return 0; }
    static void list_devices() {
        std::cout << "Audio capture not supported on this platform.\n";
    }
};

#endif

AudioCapture::AudioCapture(const AudioConfig& cfg) : impl_(new Impl(cfg)) {}

AudioCapture::~AudioCapture() { delete impl_; }

void AudioCapture::open(const std::string& device, unsigned channels, unsigned sample_rate,
                        std::size_t capacity) {
    impl_->open(device, channels, sample_rate, capacity);
}

long AudioCapture::write_position() const { return impl_->write_position(); }

std::size_t AudioCapture::capacity() const { return impl_->capacity(); }

std::size_t AudioCapture::read(std::uint8_t* out, std::size_t from, std::size_t count) {
    return impl_->read(out, from, count);
}

void AudioCapture::close() { impl_->close(); }

unsigned AudioCapture::sample_rate() const { return impl_->sample_rate(); }

void AudioCapture::list_devices() { Impl::list_devices(); }
