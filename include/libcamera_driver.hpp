/*
 * libcamera_driver.hpp
 *
 * Driver backend over libcamera. Presents a libcamera camera through the
 * same flat video surface as libfreenect: a mode table built from the
 * camera's stream formats, a caller-chosen frame buffer, and a per-frame
 * callback fired from libcamera's internal thread.
 */

#ifndef KINECT_CAMERA_LIBCAMERA_DRIVER_HPP
#define KINECT_CAMERA_LIBCAMERA_DRIVER_HPP

#include "driver.hpp"

#include <libcamera/camera_manager.h>
#include <libcamera/camera.h>
#include <libcamera/framebuffer_allocator.h>
#include <libcamera/request.h>

#include <memory>
#include <mutex>
#include <vector>

namespace KinectCamera {

class LibcameraDriver : public Driver {
public:
    // @throws DriverError if the CameraManager fails to start
    explicit LibcameraDriver(const DriverConfig& config = DriverConfig());
    ~LibcameraDriver() override;

    LibcameraDriver(const LibcameraDriver&) = delete;
    LibcameraDriver& operator=(const LibcameraDriver&) = delete;

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

    std::string name() const override { return "libcamera"; }

private:
    struct CameraSlot;

    CameraSlot& slot(DeviceHandle dev);
    void build_mode_table(CameraSlot& slot);
    int allocate_buffers(CameraSlot& slot);
    int create_requests(CameraSlot& slot);
    void release_buffers(CameraSlot& slot);
    void handle_request_complete(libcamera::Request* request);

    DriverConfig config_;
    std::shared_ptr<libcamera::CameraManager> cam_mgr_;

    std::mutex slots_mutex_;
    std::vector<std::unique_ptr<CameraSlot>> slots_;
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_LIBCAMERA_DRIVER_HPP
