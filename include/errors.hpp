/*
 * errors.hpp
 *
 * Exception types thrown by the kinect_camera library.
 */

#ifndef KINECT_CAMERA_ERRORS_HPP
#define KINECT_CAMERA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace KinectCamera {

/**
 * @brief Requested configuration is not one the device advertises.
 * Thrown before any driver call is made.
 */
class ConfigurationRejected : public std::invalid_argument {
public:
    explicit ConfigurationRejected(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief A driver entry point returned a nonzero status.
 * The status is kept verbatim in code().
 */
class DriverError : public std::runtime_error {
public:
    DriverError(const std::string& what, int code);

    int code() const { return code_; }

private:
    int code_;
};

/**
 * @brief A frame callback named a device handle with no registered Device.
 * Indicates a lifecycle bug between the driver and the registry.
 */
class RegistryDesync : public std::logic_error {
public:
    explicit RegistryDesync(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_ERRORS_HPP
