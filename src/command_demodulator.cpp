#include "command_demodulator.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(const std::string& context) {
    return context + ": " + std::strerror(errno);
}

// Temporary sample file, removed when the job is done.
class SampleFile {
public:
    SampleFile() {
        const char* tmp = std::getenv("TMPDIR");
        path_ = std::string(tmp && *tmp ? tmp : "/tmp") + "/tbskrx-XXXXXX";
        fd_ = ::mkstemp(&path_[0]);
        if (fd_ < 0) {
            throw DecodeError(errno_message("mkstemp " + path_));
        }
    }

    ~SampleFile() {
        if (fd_ >= 0) ::close(fd_);
        ::unlink(path_.c_str());
    }

    SampleFile(const SampleFile&) = delete;
    SampleFile& operator=(const SampleFile&) = delete;

    void write_samples(const std::vector<double>& samples) {
        std::vector<unsigned char> bytes(samples.size() * 4);
        for (std::size_t i = 0; i < samples.size(); ++i) {
            float value = static_cast<float>(samples[i]);
            uint32_t word = 0;
            std::memcpy(&word, &value, sizeof(word));
            bytes[4 * i] = static_cast<unsigned char>(word & 0xFF);
            bytes[4 * i + 1] = static_cast<unsigned char>((word >> 8) & 0xFF);
            bytes[4 * i + 2] = static_cast<unsigned char>((word >> 16) & 0xFF);
            bytes[4 * i + 3] = static_cast<unsigned char>((word >> 24) & 0xFF);
        }

        std::size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw DecodeError(errno_message("write " + path_));
            }
            written += static_cast<std::size_t>(n);
        }
        ::close(fd_);
        fd_ = -1;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_{-1};
};

} // namespace

struct CommandDemodulator::Impl {
    std::string command;
    unsigned sample_rate;

    std::string run(const std::string& sample_path) const {
        std::string line = "TBSKRX_SAMPLE_RATE=" + std::to_string(sample_rate) + " " +
                           command + " '" + sample_path + "'";

        FILE* pipe = ::popen(line.c_str(), "r");
        if (!pipe) {
            throw DecodeError(errno_message("popen"));
        }

        std::string output;
        char buffer[256];
        std::size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            output.append(buffer, n);
        }

        int status = ::pclose(pipe);
        if (status == -1) {
            throw DecodeError(errno_message("pclose"));
        }
        if (!WIFEXITED(status)) {
            throw DecodeError("demodulator terminated abnormally: " + command);
        }
        if (WEXITSTATUS(status) != 0) {
            throw DecodeError("demodulator exited with status " +
                              std::to_string(WEXITSTATUS(status)));
        }
        return output;
    }
};

CommandDemodulator::CommandDemodulator(const std::string& command, unsigned sample_rate)
    : impl_(new Impl{command, sample_rate}) {
    if (command.empty()) {
        throw std::invalid_argument("demodulator command is empty");
    }
}

CommandDemodulator::~CommandDemodulator() = default;

std::vector<uint8_t> CommandDemodulator::demodulate(const std::vector<double>& samples) {
    SampleFile file;
    file.write_samples(samples);
    return parse_bits(impl_->run(file.path()));
}

std::vector<uint8_t> CommandDemodulator::parse_bits(const std::string& output) {
    std::vector<uint8_t> bits;
    bits.reserve(output.size());
    for (char c : output) {
        if (c == '0') bits.push_back(0);
        else if (c == '1') bits.push_back(1);
    }
    return bits;
}
