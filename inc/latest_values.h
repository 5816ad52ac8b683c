// latest_values.h
#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include "value_source.h"

namespace stripplot {

// Single-slot holder shared by a producer thread and the render loop.
// Last writer wins: frames written between two reads are dropped. Only
// whole frames are published, so a reader never sees a partial one.
class LatestValues {
public:
    void set(ValueFrame values) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_ = std::move(values);
        ++updates_;
    }

    std::optional<ValueFrame> get() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.reset();
    }

    std::uint64_t update_count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return updates_;
    }

    // Accessor for PlotEngine; the slot must outlive it.
    ValueAccessor accessor() const {
        return [this]() { return get(); };
    }

private:
    mutable std::mutex mtx_;
    std::optional<ValueFrame> values_;
    std::uint64_t updates_ = 0;
};

}  // namespace stripplot
