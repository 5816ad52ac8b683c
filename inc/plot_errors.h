// plot_errors.h
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace stripplot {

// A per-row configuration list does not have one entry per row.
class ConfigurationMismatch : public std::invalid_argument {
public:
    ConfigurationMismatch(const std::string& what_list, std::size_t expected, std::size_t actual)
        : std::invalid_argument("Expected " + std::to_string(expected) + " " + what_list +
                                " entries, got " + std::to_string(actual)),
          list_(what_list), expected_(expected), actual_(actual) {}

    const std::string& list_name() const { return list_; }
    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

private:
    std::string list_;
    std::size_t expected_;
    std::size_t actual_;
};

// Row addressing outside [0, row_count).
class IndexOutOfRange : public std::out_of_range {
public:
    IndexOutOfRange(long index, std::size_t row_count)
        : std::out_of_range("Axis index " + std::to_string(index) + " must be in [0," +
                            std::to_string(row_count) + ")"),
          index_(index), row_count_(row_count) {}

    long index() const { return index_; }
    std::size_t row_count() const { return row_count_; }

private:
    long index_;
    std::size_t row_count_;
};

// The value source returned a frame of the wrong length.
class ValueCountMismatch : public std::runtime_error {
public:
    ValueCountMismatch(std::size_t expected, std::size_t received)
        : std::runtime_error("Expected " + std::to_string(expected) + " values per frame, received " +
                             std::to_string(received)),
          expected_(expected), received_(received) {}

    std::size_t expected() const { return expected_; }
    std::size_t received() const { return received_; }

private:
    std::size_t expected_;
    std::size_t received_;
};

}  // namespace stripplot
