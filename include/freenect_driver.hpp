/*
 * freenect_driver.hpp
 *
 * Driver backend over the libfreenect C API (Kinect v1 RGB/IR camera).
 */

#ifndef KINECT_CAMERA_FREENECT_DRIVER_HPP
#define KINECT_CAMERA_FREENECT_DRIVER_HPP

#include "driver.hpp"

#include <libfreenect.h>

#include <mutex>
#include <unordered_map>

namespace KinectCamera {

class FreenectDriver : public Driver {
public:
    // @throws DriverError if freenect_init fails
    explicit FreenectDriver(const DriverConfig& config = DriverConfig());
    ~FreenectDriver() override;

    FreenectDriver(const FreenectDriver&) = delete;
    FreenectDriver& operator=(const FreenectDriver&) = delete;

    int num_devices() override;
    DeviceHandle open_device(int index) override;
    int close_device(DeviceHandle dev) override;
    int process_events() override;

    void set_video_callback(DeviceHandle dev, FrameCallback callback) override;
    int start_video(DeviceHandle dev) override;
    int stop_video(DeviceHandle dev) override;
    int set_video_buffer(DeviceHandle dev, void* buffer) override;
    int set_video_mode(DeviceHandle dev, const NativeFrameMode& mode) override;
    int get_video_mode_count(DeviceHandle dev) override;
    NativeFrameMode get_video_mode(DeviceHandle dev, int index) override;

    std::string name() const override { return "freenect"; }

private:
    // Fixed-signature callback handed to libfreenect.
    static void video_callback(freenect_device* dev, void* video, uint32_t timestamp);

    void handle_video(freenect_device* dev, void* video, uint32_t timestamp);

    DriverConfig config_;
    freenect_context* ctx_ = nullptr;

    std::mutex callback_mutex_;
    std::unordered_map<DeviceHandle, FrameCallback> callbacks_;
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_FREENECT_DRIVER_HPP
