/*
 * errors.cpp
 */

#include "errors.hpp"

namespace KinectCamera {

DriverError::DriverError(const std::string& what, int code)
    : std::runtime_error(what + " Error Code: " + std::to_string(code)),
      code_(code) {}

} // namespace KinectCamera
