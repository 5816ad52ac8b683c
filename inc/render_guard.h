// render_guard.h
#pragma once

#include <exception>
#include <iostream>

namespace stripplot {

// Runs one rendering step at the loop boundary. A failure is logged under
// `component` and reported as false so the loop can stop and tear down
// instead of unwinding into the host.
template <typename Step>
bool render_guarded(const char* component, Step&& step) {
    try {
        step();
        return true;
    } catch (const std::exception& e) {
        std::cerr << component << ": rendering failed, closing: " << e.what() << std::endl;
        return false;
    }
}

}  // namespace stripplot
