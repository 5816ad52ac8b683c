// serial_producer.h
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "latest_values.h"

namespace stripplot {

// Splits a byte stream into newline-terminated lines.
class LineAccumulator {
public:
    explicit LineAccumulator(std::size_t max_line = 256) : max_line_(max_line) {}

    // Returns the completed line (without terminator) when `c` ends one.
    std::optional<std::string> feed(char c);

    std::size_t overflows() const { return overflows_; }

private:
    std::string line_;
    std::size_t max_line_;
    std::size_t overflows_ = 0;
    bool discarding_ = false;
};

// Parses one numeric sample; surrounding whitespace is allowed.
std::optional<double> parse_sample(const std::string& line);

struct SerialProducerConfig {
    std::string port = "/dev/ttyACM0";
    int baud = 115200;
};

// Reads numeric lines from a serial device and publishes each as a
// one-value frame. Unparseable lines are skipped.
class SerialProducer {
public:
    SerialProducer(LatestValues& slot, const SerialProducerConfig& config);
    ~SerialProducer();

    SerialProducer(const SerialProducer&) = delete;
    SerialProducer& operator=(const SerialProducer&) = delete;

    // Opens the port and starts reading. Returns false if the port could not
    // be opened or configured; see last_error().
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    std::uint64_t samples() const { return samples_.load(); }
    std::uint64_t rejected_lines() const { return rejected_.load(); }
    std::string last_error() const;

private:
    void reader_loop();
    void fail(const std::string& msg);

    LatestValues& slot_;
    SerialProducerConfig config_;
    int fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> samples_{0};
    std::atomic<std::uint64_t> rejected_{0};

    mutable std::mutex error_mtx_;
    std::string last_error_;
};

}  // namespace stripplot
