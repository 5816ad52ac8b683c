// sine_producer.h
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include "latest_values.h"

namespace stripplot {

struct SineProducerConfig {
    std::size_t rows = 2;      // row k (1-based) runs at k cycles per window
    std::size_t size = 100;    // steps per slowest cycle
    int step_usec = 2000;
    bool phase_pair = false;   // prepend (cos, sin) of the slowest row
};

// Synthetic acquisition thread publishing sine waves into a LatestValues slot.
class SineProducer {
public:
    SineProducer(LatestValues& slot, const SineProducerConfig& config);
    ~SineProducer();

    SineProducer(const SineProducer&) = delete;
    SineProducer& operator=(const SineProducer&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_.load(); }
    std::uint64_t steps() const { return step_.load(); }

    // Frame published at a given step.
    static ValueFrame values_at(const SineProducerConfig& config, std::uint64_t step);

private:
    void producer_loop();

    LatestValues& slot_;
    SineProducerConfig config_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> step_{0};
};

}  // namespace stripplot
