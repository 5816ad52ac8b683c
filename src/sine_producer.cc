// sine_producer.cc
#include "sine_producer.h"
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace stripplot {

SineProducer::SineProducer(LatestValues& slot, const SineProducerConfig& config)
    : slot_(slot), config_(config) {
    if (config_.rows == 0 || config_.size == 0) {
        throw std::invalid_argument("SineProducer needs at least one row and a non-zero size");
    }
    if (config_.step_usec <= 0) {
        throw std::invalid_argument("SineProducer step must be > 0 usec");
    }
}

SineProducer::~SineProducer() { stop(); }

void SineProducer::start() {
    if (running_.load()) return;
    running_.store(true);
    thread_ = std::thread(&SineProducer::producer_loop, this);
}

void SineProducer::stop() {
    running_.store(false);
    if (thread_.joinable()) thread_.join();
}

ValueFrame SineProducer::values_at(const SineProducerConfig& config, std::uint64_t step) {
    const double size = static_cast<double>(config.size);
    const double pos = static_cast<double>(step % config.size);
    const double two_pi = 2.0 * M_PI;

    ValueFrame values;
    values.reserve(config.rows + 2);
    if (config.phase_pair) {
        values.push_back(std::cos(two_pi * pos / size));
        values.push_back(std::sin(two_pi * pos / size));
    }
    for (std::size_t row = 1; row <= config.rows; ++row) {
        values.push_back(std::sin(static_cast<double>(row) * two_pi * pos / size));
    }
    return values;
}

void SineProducer::producer_loop() {
    using Clock = std::chrono::steady_clock;

    auto next = Clock::now();
    while (running_.load()) {
        std::uint64_t step = ++step_;
        slot_.set(values_at(config_, step));

        next += std::chrono::microseconds(config_.step_usec);
        std::this_thread::sleep_until(next);
    }
}

}  // namespace stripplot
