// rolling_buffer.cc
#include "rolling_buffer.h"
#include <stdexcept>
#include <string>

namespace stripplot {

RollingBuffer::RollingBuffer(std::size_t capacity, double fill)
    : data_(capacity, fill) {
    if (capacity == 0) {
        throw std::invalid_argument("RollingBuffer capacity must be > 0");
    }
}

void RollingBuffer::append(double value) {
    data_[head_] = value;
    head_ = (head_ + 1) % data_.size();
    ++appends_;
}

std::vector<double> RollingBuffer::contents() const {
    std::vector<double> out;
    out.reserve(data_.size());
    out.insert(out.end(), data_.begin() + head_, data_.end());
    out.insert(out.end(), data_.begin(), data_.begin() + head_);
    return out;
}

double RollingBuffer::at(std::size_t i) const {
    if (i >= data_.size()) {
        throw std::out_of_range("RollingBuffer index " + std::to_string(i) +
                                " outside [0," + std::to_string(data_.size()) + ")");
    }
    return data_[(head_ + i) % data_.size()];
}

double RollingBuffer::latest() const {
    return data_[(head_ + data_.size() - 1) % data_.size()];
}

}  // namespace stripplot
