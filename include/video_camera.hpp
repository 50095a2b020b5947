/*
 * video_camera.hpp
 *
 * RGB/IR video stream of one opened device.
 *
 * Thread model: configuration calls (set_mode, set_data_buffer, start, stop)
 * come from the application. Frames arrive on the driver's callback thread
 * and DataReceived handlers run there, synchronously. Buffer replacement and
 * frame delivery are serialised on frame_mutex_.
 */

#ifndef KINECT_CAMERA_VIDEO_CAMERA_HPP
#define KINECT_CAMERA_VIDEO_CAMERA_HPP

#include "frame_mode.hpp"
#include "image_map.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace KinectCamera {

class Device;
class Driver;
struct FrameCallbackGate;

struct DataReceivedEvent {
    std::chrono::system_clock::time_point timestamp;

    // Buffer the frame was written to. Stays valid while the event (or a
    // copy of `image`) is held.
    std::shared_ptr<const ImageMap> image;
};

class VideoCamera {
public:
    using DataReceivedHandler = std::function<void(Device&, const DataReceivedEvent&)>;

    /**
     * @brief Enumerates modes, applies the first one and registers the
     * frame callback for the parent's driver handle.
     * @throws std::runtime_error if the driver reports no usable mode
     * @throws DriverError if applying the default mode fails
     */
    explicit VideoCamera(Device& parent);
    ~VideoCamera();

    VideoCamera(const VideoCamera&) = delete;
    VideoCamera& operator=(const VideoCamera&) = delete;

    /**
     * @brief Stops a running stream, unregisters the frame callback and
     * waits for a callback already inside deliver_frame() to return.
     * Later callbacks are reported as RegistryDesync. Safe to call twice.
     * @throws std::logic_error if called from this camera's own handler
     */
    void detach();

    // --- Streaming ---
    void start();
    void stop();
    bool is_running() const { return running_; }

    // --- Configuration ---
    VideoFrameMode mode() const;

    /**
     * @brief Switches the video mode. Lookup is by format and resolution.
     * @throws ConfigurationRejected if the mode is not in modes()
     * @throws DriverError if the driver refuses the mode or its buffer; the
     * old mode and buffer stay active
     */
    void set_mode(const VideoFrameMode& mode);

    const std::vector<VideoFrameMode>& modes() const { return modes_; }

    // nullptr when the library manages the buffer.
    void* data_buffer() const;

    /**
     * @brief Points the driver at caller-owned memory, or back at a library
     * buffer when `buffer` is nullptr. Takes effect immediately.
     * @throws DriverError if the driver rejects it; nothing changes
     */
    void set_data_buffer(void* buffer);

    // Buffer the next frame will be written to.
    std::shared_ptr<const ImageMap> next_frame_image() const;

    // --- DataReceived event ---
    int add_data_received_handler(DataReceivedHandler handler);
    void remove_data_received_handler(int id);

    // Called from the driver callback path via dispatch_video_frame().
    void deliver_frame(void* data, uint32_t timestamp);

private:
    void update_video_modes();
    void update_next_frame_image(const VideoFrameMode& mode, void* buffer);

    Device& parent_;
    Driver& driver_;

    std::vector<VideoFrameMode> modes_;
    std::atomic<bool> running_{false};

    mutable std::mutex frame_mutex_;
    VideoFrameMode mode_;
    void* data_buffer_ = nullptr;
    std::shared_ptr<const ImageMap> next_frame_image_;
    // Superseded by the last swap; kept until the following one.
    std::shared_ptr<const ImageMap> retired_frame_image_;

    // Shared with the registered driver callback, which may outlive us.
    std::shared_ptr<FrameCallbackGate> gate_;

    std::mutex handler_mutex_;
    std::map<int, DataReceivedHandler> handlers_;
    int next_handler_id_ = 1;
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_VIDEO_CAMERA_HPP
