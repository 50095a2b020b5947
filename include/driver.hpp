/*
 * driver.hpp
 *
 * Flat native driver surface consumed by the video camera adapter.
 * Implemented over libfreenect (FreenectDriver) and libcamera
 * (LibcameraDriver); tests provide a scripted implementation.
 */

#ifndef KINECT_CAMERA_DRIVER_HPP
#define KINECT_CAMERA_DRIVER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace KinectCamera {

// Opaque per-device pointer owned by the driver.
using DeviceHandle = void*;

/**
 * @brief Frame-ready callback: (device, frame data, timestamp in seconds).
 * Invoked on a driver-owned thread once per completed frame.
 */
using FrameCallback = std::function<void(DeviceHandle, void*, uint32_t)>;

/**
 * @brief Native mode descriptor, laid out like freenect_frame_mode.
 * `format` and `resolution` carry freenect_video_format and
 * freenect_resolution values. `token` is driver private.
 */
struct NativeFrameMode {
    uint32_t token = 0;
    int32_t resolution = 0;
    int32_t format = 0;
    int32_t bytes = 0;
    int16_t width = 0;
    int16_t height = 0;
    int8_t data_bits_per_pixel = 0;
    int8_t padding_bits_per_pixel = 0;
    int8_t framerate = 0;
    bool is_valid = false;
};

enum class DriverLogLevel {
    Fatal = 0,
    Error,
    Warning,
    Notice,
    Info,
    Debug,
    Spew,
    Flood,
};

struct DriverConfig {
    // "freenect" or "libcamera"
    std::string backend = "freenect";

    DriverLogLevel log_level = DriverLogLevel::Warning;

    // Upper bound on one process_events() call.
    int poll_interval_ms = 10;
};

class Driver {
public:
    virtual ~Driver() = default;

    // --- Device lifecycle ---
    virtual int num_devices() = 0;

    /**
     * @brief Opens device `index`.
     * @throws DriverError if the driver refuses the open.
     */
    virtual DeviceHandle open_device(int index) = 0;
    virtual int close_device(DeviceHandle dev) = 0;

    /**
     * @brief Pumps driver events for at most one poll interval.
     * Frame callbacks fire from inside this call (freenect) or from a
     * thread owned by the driver library (libcamera).
     * @return negative on a fatal driver error
     */
    virtual int process_events() = 0;

    // --- Video stream ---
    // An empty callback unregisters the device.
    virtual void set_video_callback(DeviceHandle dev, FrameCallback callback) = 0;
    virtual int start_video(DeviceHandle dev) = 0;
    virtual int stop_video(DeviceHandle dev) = 0;
    virtual int set_video_buffer(DeviceHandle dev, void* buffer) = 0;
    virtual int set_video_mode(DeviceHandle dev, const NativeFrameMode& mode) = 0;
    virtual int get_video_mode_count(DeviceHandle dev) = 0;
    virtual NativeFrameMode get_video_mode(DeviceHandle dev, int index) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Builds the backend named by config.backend.
 * @throws std::invalid_argument for an unknown backend name
 */
std::unique_ptr<Driver> make_driver(const DriverConfig& config);

DriverConfig sanitise(const DriverConfig& in);

} // namespace KinectCamera

#endif // KINECT_CAMERA_DRIVER_HPP
