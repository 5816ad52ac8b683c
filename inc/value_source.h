// value_source.h
#pragma once

#include <functional>
#include <optional>
#include <vector>

namespace stripplot {

// Flat frame of current values: the two phase channels first (when a phase
// panel exists), then one value per series in row-then-binding order.
using ValueFrame = std::vector<double>;

// Zero-argument pull; std::nullopt means "no data yet".
using ValueAccessor = std::function<std::optional<ValueFrame>()>;

// Anything that can tell the engine its window went away.
class CloseNotifier {
public:
    virtual ~CloseNotifier() = default;
    virtual void on_close(std::function<void()> handler) = 0;
};

}  // namespace stripplot
