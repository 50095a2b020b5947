/*
 * logging.cpp
 */

#include "log.hpp"

#include <atomic>

namespace KinectCamera {

namespace {
std::atomic<bool> debug_enabled_{false};
}

void enable_debug(bool enable) {
    debug_enabled_ = enable;
    LOG_INFO("Debug: " << enable);
}

bool debug_enabled() {
    return debug_enabled_;
}

} // namespace KinectCamera
