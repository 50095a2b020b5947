/*
 * device.hpp
 *
 * One opened sensor unit. Created by Context::open_device().
 */

#ifndef KINECT_CAMERA_DEVICE_HPP
#define KINECT_CAMERA_DEVICE_HPP

#include "driver.hpp"
#include "video_camera.hpp"

#include <memory>

namespace KinectCamera {

class Context;

class Device {
public:
    /**
     * @brief Opens driver device `index` and registers it with the context.
     * @throws DriverError if the open fails; nothing stays registered
     */
    Device(Context& context, int index);
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    /**
     * @brief Stops the video stream, waits for a frame handler already
     * running, unregisters and closes the handle. Safe to call more than once.
     * @throws DriverError if the driver fails to close the handle
     * @throws std::logic_error if called from this device's own frame handler
     */
    void close();
    bool is_open() const { return handle_ != nullptr; }

    int index() const { return index_; }
    DeviceHandle handle() const { return handle_; }

    Context& context() { return context_; }
    Driver& driver();

    // @throws std::runtime_error after close()
    VideoCamera& video_camera();

private:
    Context& context_;
    int index_;
    DeviceHandle handle_ = nullptr;
    std::unique_ptr<VideoCamera> video_camera_;
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_DEVICE_HPP
