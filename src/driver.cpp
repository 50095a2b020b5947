/*
 * driver.cpp
 *
 * Driver configuration defaults.
 */

#include "driver.hpp"

namespace KinectCamera {

DriverConfig sanitise(const DriverConfig& in) {
    DriverConfig cfg = in;

    if (cfg.backend.empty()) cfg.backend = "freenect";

    if (cfg.log_level < DriverLogLevel::Fatal) cfg.log_level = DriverLogLevel::Fatal;
    if (cfg.log_level > DriverLogLevel::Flood) cfg.log_level = DriverLogLevel::Flood;

    if (cfg.poll_interval_ms < 1)    cfg.poll_interval_ms = 1;
    if (cfg.poll_interval_ms > 1000) cfg.poll_interval_ms = 1000;

    return cfg;
}

} // namespace KinectCamera
