// rolling_buffer.h
#pragma once

#include <cstddef>
#include <vector>

namespace stripplot {

// Fixed-capacity sliding window of samples. Always holds exactly capacity()
// values, oldest first; pre-filled with `fill` at construction.
class RollingBuffer {
public:
    explicit RollingBuffer(std::size_t capacity, double fill = 0.0);

    // Drops the oldest sample and stores `value` as the newest.
    void append(double value);

    std::vector<double> contents() const;

    // i = 0 is the oldest sample.
    double at(std::size_t i) const;
    double latest() const;

    std::size_t capacity() const { return data_.size(); }
    std::size_t append_count() const { return appends_; }

private:
    std::vector<double> data_;
    std::size_t head_ = 0;  // slot of the oldest sample
    std::size_t appends_ = 0;
};

}  // namespace stripplot
