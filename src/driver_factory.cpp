/*
 * driver_factory.cpp
 */

#include "driver.hpp"
#include "freenect_driver.hpp"
#include "libcamera_driver.hpp"

#include <stdexcept>

namespace KinectCamera {

std::unique_ptr<Driver> make_driver(const DriverConfig& config) {
    DriverConfig cfg = sanitise(config);
    if (cfg.backend == "freenect") {
        return std::make_unique<FreenectDriver>(cfg);
    }
    if (cfg.backend == "libcamera") {
        return std::make_unique<LibcameraDriver>(cfg);
    }
    throw std::invalid_argument("Unknown driver backend: " + cfg.backend);
}

} // namespace KinectCamera
