#include "audio_capture.hpp"
#include "command_demodulator.hpp"
#include "receiver_config.hpp"
#include "recording_controller.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void handle_sigint(int) {
    g_running = false;
}

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--list-devices] [--device NAME] [--demod COMMAND]\n"
              << "\n"
              << "Receives TBSK messages from the microphone and prints them.\n"
              << "COMMAND is run once per decode with a raw float32 sample file as its last\n"
              << "argument and must print the recovered bits as 0/1 characters.\n"
              << "Tuning is read from TBSKRX_* environment variables.\n";
}
} // namespace

int main(int argc, char** argv) {
    ReceiverConfig cfg;
    try {
        apply_env_overrides(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--list-devices") == 0) {
            AudioCapture::list_devices();
            return 0;
        } else if (std::strcmp(argv[i], "--device") == 0 && i + 1 < argc) {
            cfg.device = argv[++i];
        } else if (std::strcmp(argv[i], "--demod") == 0 && i + 1 < argc) {
            cfg.demod_command = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        validate_config(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    }
    if (cfg.demod_command.empty()) {
        std::cerr << "No demodulator configured; pass --demod or set TBSKRX_DEMOD_COMMAND.\n";
        return 2;
    }

    std::signal(SIGINT, handle_sigint);

    RecordingController receiver(cfg, std::make_unique<AudioCapture>(),
                                 std::make_unique<CommandDemodulator>(cfg.demod_command,
                                                                      cfg.sample_rate));
    receiver.add_message_listener([](const std::string& message) {
        std::cout << message << std::endl;
    });

    try {
        receiver.start();
    } catch (const std::exception& e) {
        std::cerr << "Failed to start audio capture: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nListening... Press Ctrl+C to quit.\n";
    using clock = std::chrono::steady_clock;
    const auto interval = std::chrono::milliseconds(cfg.tick_interval_ms);
    auto last = clock::now();
    while (g_running) {
        std::this_thread::sleep_for(interval);
        auto now = clock::now();
        receiver.tick(std::chrono::duration<double>(now - last).count());
        last = now;
    }

    receiver.stop();

    DecodeStats stats = receiver.stats();
    std::cout << "Decodes: " << stats.accepted << ", messages: " << stats.delivered
              << ", dropped triggers: " << stats.dropped << ", failures: " << stats.failed
              << "\n";
    std::cout << "Exiting.\n";
    return 0;
}
