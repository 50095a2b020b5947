/*
 * freenect_driver.cpp
 */

#include "freenect_driver.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <sys/time.h>

namespace KinectCamera {

namespace {

// LIBUSB_ERROR_INTERRUPTED; a signal woke the event wait.
constexpr int kUsbInterrupted = -10;

freenect_device* to_device(DeviceHandle dev) {
    return static_cast<freenect_device*>(dev);
}

freenect_loglevel to_freenect(DriverLogLevel level) {
    switch (level) {
        case DriverLogLevel::Fatal:   return FREENECT_LOG_FATAL;
        case DriverLogLevel::Error:   return FREENECT_LOG_ERROR;
        case DriverLogLevel::Warning: return FREENECT_LOG_WARNING;
        case DriverLogLevel::Notice:  return FREENECT_LOG_NOTICE;
        case DriverLogLevel::Info:    return FREENECT_LOG_INFO;
        case DriverLogLevel::Debug:   return FREENECT_LOG_DEBUG;
        case DriverLogLevel::Spew:    return FREENECT_LOG_SPEW;
        case DriverLogLevel::Flood:   return FREENECT_LOG_FLOOD;
    }
    return FREENECT_LOG_WARNING;
}

NativeFrameMode from_freenect(const freenect_frame_mode& mode) {
    NativeFrameMode native;
    native.token = mode.reserved;
    native.resolution = static_cast<int32_t>(mode.resolution);
    native.format = static_cast<int32_t>(mode.video_format);
    native.bytes = mode.bytes;
    native.width = mode.width;
    native.height = mode.height;
    native.data_bits_per_pixel = mode.data_bits_per_pixel;
    native.padding_bits_per_pixel = mode.padding_bits_per_pixel;
    native.framerate = mode.framerate;
    native.is_valid = mode.is_valid != 0;
    return native;
}

} // anonymous namespace

FreenectDriver::FreenectDriver(const DriverConfig& config)
    : config_(sanitise(config)) {
    int ret = freenect_init(&ctx_, nullptr);
    if (ret < 0) {
        ctx_ = nullptr;
        throw DriverError("freenect_init failed.", ret);
    }
    freenect_set_log_level(ctx_, to_freenect(config_.log_level));
    // Only the camera subdevice; motor and audio stay unclaimed
    freenect_select_subdevices(ctx_, FREENECT_DEVICE_CAMERA);
    LOG_INFO("libfreenect initialised");
}

FreenectDriver::~FreenectDriver() {
    if (ctx_) {
        int ret = freenect_shutdown(ctx_);
        if (ret < 0) {
            LOG_WARN("freenect_shutdown returned " << ret);
        }
        ctx_ = nullptr;
    }
}

int FreenectDriver::num_devices() {
    return freenect_num_devices(ctx_);
}

DeviceHandle FreenectDriver::open_device(int index) {
    freenect_device* dev = nullptr;
    int ret = freenect_open_device(ctx_, &dev, index);
    if (ret < 0 || !dev) {
        throw DriverError("Could not open device " + std::to_string(index) + ".", ret);
    }
    // Lets the static callback find this driver again
    freenect_set_user(dev, this);
    return dev;
}

int FreenectDriver::close_device(DeviceHandle dev) {
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callbacks_.erase(dev);
    }
    return freenect_close_device(to_device(dev));
}

int FreenectDriver::process_events() {
    timeval timeout;
    timeout.tv_sec = config_.poll_interval_ms / 1000;
    timeout.tv_usec = (config_.poll_interval_ms % 1000) * 1000;

    int ret = freenect_process_events_timeout(ctx_, &timeout);
    if (ret == kUsbInterrupted) {
        return 0;
    }
    return ret;
}

void FreenectDriver::set_video_callback(DeviceHandle dev, FrameCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callback) {
        callbacks_[dev] = std::move(callback);
        freenect_set_video_callback(to_device(dev), &FreenectDriver::video_callback);
    } else {
        callbacks_.erase(dev);
        freenect_set_video_callback(to_device(dev), nullptr);
    }
}

int FreenectDriver::start_video(DeviceHandle dev) {
    return freenect_start_video(to_device(dev));
}

int FreenectDriver::stop_video(DeviceHandle dev) {
    return freenect_stop_video(to_device(dev));
}

int FreenectDriver::set_video_buffer(DeviceHandle dev, void* buffer) {
    return freenect_set_video_buffer(to_device(dev), buffer);
}

int FreenectDriver::set_video_mode(DeviceHandle dev, const NativeFrameMode& mode) {
    freenect_frame_mode found = freenect_find_video_mode(
        static_cast<freenect_resolution>(mode.resolution),
        static_cast<freenect_video_format>(mode.format));
    if (!found.is_valid) {
        return -1;
    }
    return freenect_set_video_mode(to_device(dev), found);
}

int FreenectDriver::get_video_mode_count(DeviceHandle) {
    // The mode table is global in libfreenect
    return freenect_get_video_mode_count();
}

NativeFrameMode FreenectDriver::get_video_mode(DeviceHandle, int index) {
    return from_freenect(freenect_get_video_mode(index));
}

void FreenectDriver::video_callback(freenect_device* dev, void* video, uint32_t timestamp) {
    auto* self = static_cast<FreenectDriver*>(freenect_get_user(dev));
    if (!self) {
        LOG_ERROR("Video frame for device " << static_cast<void*>(dev) << " without a driver");
        return;
    }
    self->handle_video(dev, video, timestamp);
}

void FreenectDriver::handle_video(freenect_device* dev, void* video, uint32_t timestamp) {
    FrameCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        auto it = callbacks_.find(dev);
        if (it != callbacks_.end()) {
            callback = it->second;
        }
    }
    if (!callback) {
        LOG_ERROR("Video frame for device " << static_cast<void*>(dev) << " with no registered callback");
        return;
    }

    // Exceptions must not unwind through libfreenect
    try {
        callback(dev, video, timestamp);
    } catch (const std::exception& e) {
        LOG_ERROR("Video frame handler failed: " << e.what());
    }
}

} // namespace KinectCamera
