// serial_producer.cc
#include "serial_producer.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

namespace stripplot {

namespace {

std::optional<speed_t> speed_for_baud(int baud) {
    switch (baud) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default: return std::nullopt;
    }
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

std::optional<std::string> LineAccumulator::feed(char c) {
    if (c == '\n') {
        if (discarding_) {
            discarding_ = false;
            line_.clear();
            return std::nullopt;
        }
        std::string out;
        out.swap(line_);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return out;
    }

    if (discarding_) return std::nullopt;

    if (line_.size() >= max_line_) {
        // Runaway line; drop it through the next terminator
        ++overflows_;
        discarding_ = true;
        line_.clear();
        return std::nullopt;
    }

    line_.push_back(c);
    return std::nullopt;
}

std::optional<double> parse_sample(const std::string& line) {
    std::size_t begin = 0, end = line.size();
    while (begin < end && is_space(line[begin])) ++begin;
    while (end > begin && is_space(line[end - 1])) --end;
    if (begin == end) return std::nullopt;

    std::string text = line.substr(begin, end - begin);
    char* stop = nullptr;
    errno = 0;
    double v = std::strtod(text.c_str(), &stop);
    if (stop != text.c_str() + text.size() || errno == ERANGE) return std::nullopt;
    return v;
}

SerialProducer::SerialProducer(LatestValues& slot, const SerialProducerConfig& config)
    : slot_(slot), config_(config) {}

SerialProducer::~SerialProducer() { stop(); }

bool SerialProducer::start() {
    if (running_.load()) return true;

    auto speed = speed_for_baud(config_.baud);
    if (!speed) {
        fail("unsupported baud rate " + std::to_string(config_.baud));
        return false;
    }

    fd_ = ::open(config_.port.c_str(), O_RDONLY | O_NOCTTY);
    if (fd_ < 0) {
        fail("cannot open " + config_.port + ": " + std::strerror(errno));
        return false;
    }

    termios tty{};
    if (tcgetattr(fd_, &tty) != 0) {
        fail("tcgetattr failed on " + config_.port + ": " + std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    cfmakeraw(&tty);
    cfsetispeed(&tty, *speed);
    cfsetospeed(&tty, *speed);
    tty.c_cflag |= (CLOCAL | CREAD);
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 1;  // 100 ms read timeout so stop() is honored

    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        fail("tcsetattr failed on " + config_.port + ": " + std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&SerialProducer::reader_loop, this);
    return true;
}

void SerialProducer::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::string SerialProducer::last_error() const {
    std::lock_guard<std::mutex> lock(error_mtx_);
    return last_error_;
}

void SerialProducer::fail(const std::string& msg) {
    std::cerr << "SerialProducer: " << msg << std::endl;
    std::lock_guard<std::mutex> lock(error_mtx_);
    last_error_ = msg;
}

void SerialProducer::reader_loop() {
    LineAccumulator lines;
    char buf[256];

    while (running_.load()) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            fail("read failed on " + config_.port + ": " + std::strerror(errno));
            break;
        }

        for (ssize_t i = 0; i < n; ++i) {
            auto line = lines.feed(buf[i]);
            if (!line) continue;
            if (auto v = parse_sample(*line)) {
                slot_.set({*v});
                ++samples_;
            } else {
                ++rejected_;
            }
        }
    }

    running_.store(false);
}

}  // namespace stripplot
