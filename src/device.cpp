/*
 * device.cpp
 */

#include "device.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace KinectCamera {

Device::Device(Context& context, int index)
    : context_(context), index_(index) {
    handle_ = driver().open_device(index);

    bool registered = false;
    try {
        context_.registry().insert(handle_, this);
        registered = true;
        video_camera_ = std::make_unique<VideoCamera>(*this);
    } catch (...) {
        // A rejected insert must not drop another device's entry
        if (registered) {
            context_.registry().remove(handle_);
        }
        int result = driver().close_device(handle_);
        if (result != 0) {
            LOG_WARN("Closing device " << index_ << " after failed setup returned " << result);
        }
        handle_ = nullptr;
        throw;
    }
    LOG_INFO("Device " << index_ << " opened (" << driver().name() << ")");
}

Device::~Device() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_ERROR("Device " << index_ << " close failed: " << e.what());
    }
}

void Device::close() {
    if (!handle_) return;

    // No callback may still be inside the camera once it is destroyed
    if (video_camera_) {
        video_camera_->detach();
    }
    context_.registry().remove(handle_);
    video_camera_.reset();

    DeviceHandle handle = handle_;
    handle_ = nullptr;
    int result = driver().close_device(handle);
    if (result != 0) {
        throw DriverError("Could not close device " + std::to_string(index_) + ".", result);
    }
    LOG_INFO("Device " << index_ << " closed");
}

Driver& Device::driver() {
    return context_.driver();
}

VideoCamera& Device::video_camera() {
    if (!video_camera_) {
        throw std::runtime_error("Device " + std::to_string(index_) + " is closed.");
    }
    return *video_camera_;
}

} // namespace KinectCamera
