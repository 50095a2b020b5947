/*
 * video_camera.cpp
 *
 * Video stream adapter: mirrors the driver's mode/buffer/running state and
 * turns frame callbacks into DataReceived events.
 */

#include "video_camera.hpp"
#include "context.hpp"
#include "device.hpp"
#include "device_registry.hpp"
#include "driver.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <condition_variable>
#include <sstream>

namespace KinectCamera {

// Tracks frame callbacks running inside deliver_frame() so detach() can wait
// for them before the camera goes away.
struct FrameCallbackGate {
    std::mutex mutex;
    std::condition_variable idle;
    bool closed = false;
    int in_flight = 0;
};

namespace {

// Gate whose callback is running on this thread, if any.
thread_local const FrameCallbackGate* current_gate = nullptr;

class GateEntry {
public:
    explicit GateEntry(FrameCallbackGate& gate)
        : gate_(gate), previous_(current_gate) {
        current_gate = &gate_;
    }

    ~GateEntry() {
        current_gate = previous_;
        std::lock_guard<std::mutex> lock(gate_.mutex);
        if (--gate_.in_flight == 0) {
            gate_.idle.notify_all();
        }
    }

    GateEntry(const GateEntry&) = delete;
    GateEntry& operator=(const GateEntry&) = delete;

private:
    FrameCallbackGate& gate_;
    const FrameCallbackGate* previous_;
};

} // anonymous namespace

VideoCamera::VideoCamera(Device& parent)
    : parent_(parent), driver_(parent.driver()),
      gate_(std::make_shared<FrameCallbackGate>()) {
    update_video_modes();
    if (modes_.empty()) {
        throw std::runtime_error("Driver reported no usable video modes for device " +
                                 std::to_string(parent_.index()));
    }
    LOG_INFO("Device " << parent_.index() << ": " << modes_.size() << " video modes available");

    // Use the first mode by default
    set_mode(modes_.front());

    Context& context = parent_.context();
    std::shared_ptr<FrameCallbackGate> gate = gate_;
    driver_.set_video_callback(parent_.handle(),
        [&context, gate](DeviceHandle handle, void* data, uint32_t timestamp) {
            bool detached = false;
            {
                std::lock_guard<std::mutex> lock(gate->mutex);
                detached = gate->closed;
                if (!detached) {
                    ++gate->in_flight;
                }
            }
            if (detached) {
                std::ostringstream msg;
                msg << "Frame callback for detached handle " << handle;
                context.report_internal_error(RegistryDesync(msg.str()));
                return;
            }
            GateEntry entry(*gate);
            try {
                dispatch_video_frame(context.registry(), handle, data, timestamp);
            } catch (const RegistryDesync& e) {
                context.report_internal_error(e);
            }
        });
    LOG_DEBUG("Video callback registered for handle " << parent_.handle());
}

VideoCamera::~VideoCamera() {
    try {
        detach();
    } catch (const std::exception& e) {
        LOG_ERROR("Video camera teardown failed: " << e.what());
    }
}

void VideoCamera::detach() {
    {
        std::unique_lock<std::mutex> lock(gate_->mutex);
        if (gate_->closed) return;
        if (current_gate == gate_.get()) {
            throw std::logic_error("Device " + std::to_string(parent_.index()) +
                                   " cannot be closed from its own frame handler");
        }
    }

    if (running_) {
        int result = driver_.stop_video(parent_.handle());
        if (result != 0) {
            LOG_WARN("Could not stop video stream during teardown. Error Code: " << result);
        }
        running_ = false;
    }

    {
        std::unique_lock<std::mutex> lock(gate_->mutex);
        gate_->closed = true;
        gate_->idle.wait(lock, [this] { return gate_->in_flight == 0; });
    }
    driver_.set_video_callback(parent_.handle(), nullptr);
    LOG_DEBUG("Video callback detached from handle " << parent_.handle());
}

void VideoCamera::start() {
    std::lock_guard<std::mutex> lock(frame_mutex_);

    // Mode or buffer may have changed since the last configuration
    update_next_frame_image(mode_, data_buffer_);

    int result = driver_.start_video(parent_.handle());
    if (result != 0) {
        throw DriverError("Could not start video stream.", result);
    }
    running_ = true;
    LOG_INFO("Video stream started: " << mode_.to_string());
}

void VideoCamera::stop() {
    int result = driver_.stop_video(parent_.handle());
    if (result != 0) {
        throw DriverError("Could not stop video stream.", result);
    }
    running_ = false;
    LOG_INFO("Video stream stopped");
}

VideoFrameMode VideoCamera::mode() const {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    return mode_;
}

void VideoCamera::set_mode(const VideoFrameMode& mode) {
    // Re-validate against the enumerated list rather than trusting the caller
    const VideoFrameMode* found = VideoFrameMode::find(modes_, mode.format(), mode.resolution());
    if (!found) {
        throw ConfigurationRejected(std::string("Invalid Video Mode: [") +
                                    to_string(mode.format()) + ", " +
                                    to_string(mode.resolution()) + "]");
    }

    std::lock_guard<std::mutex> lock(frame_mutex_);
    int result = driver_.set_video_mode(parent_.handle(), found->native());
    if (result != 0) {
        throw DriverError("Mode switch failed.", result);
    }

    try {
        update_next_frame_image(*found, data_buffer_);
    } catch (...) {
        // Driver must not keep the new mode with a buffer sized for the old one
        if (next_frame_image_) {
            int rollback = driver_.set_video_mode(parent_.handle(), mode_.native());
            if (rollback != 0) {
                LOG_ERROR("Could not restore video mode " << mode_.to_string()
                          << ". Error Code: " << rollback);
            }
        }
        throw;
    }
    mode_ = *found;
    LOG_DEBUG("Video mode set to " << mode_.to_string());
}

void* VideoCamera::data_buffer() const {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    return data_buffer_;
}

void VideoCamera::set_data_buffer(void* buffer) {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    update_next_frame_image(mode_, buffer);
    data_buffer_ = buffer;
    LOG_DEBUG("Data buffer set to " << buffer
              << (buffer ? " (caller managed)" : " (library managed)"));
}

std::shared_ptr<const ImageMap> VideoCamera::next_frame_image() const {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    return next_frame_image_;
}

int VideoCamera::add_data_received_handler(DataReceivedHandler handler) {
    if (!handler) {
        throw std::invalid_argument("DataReceived handler must not be empty");
    }
    std::lock_guard<std::mutex> lock(handler_mutex_);
    int id = next_handler_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void VideoCamera::remove_data_received_handler(int id) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handlers_.erase(id);
}

void VideoCamera::deliver_frame(void* data, uint32_t timestamp) {
    DataReceivedEvent event;
    event.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(timestamp));
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        // A frame written before the last swap belongs to the retired buffer
        if (retired_frame_image_ && data == retired_frame_image_->data() &&
            data != next_frame_image_->data()) {
            event.image = retired_frame_image_;
        } else {
            event.image = next_frame_image_;
        }
    }

    std::vector<DataReceivedHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& entry : handlers_) {
            handlers.push_back(entry.second);
        }
    }

    for (const auto& handler : handlers) {
        handler(parent_, event);
    }
}

void VideoCamera::update_video_modes() {
    std::vector<VideoFrameMode> modes;

    int count = driver_.get_video_mode_count(parent_.handle());
    for (int i = 0; i < count; ++i) {
        NativeFrameMode native = driver_.get_video_mode(parent_.handle(), i);
        if (auto mode = VideoFrameMode::from_native(native)) {
            modes.push_back(*mode);
        } else {
            LOG_DEBUG("Skipping unrecognised video mode descriptor " << i);
        }
    }

    modes_ = std::move(modes);
}

// Caller holds frame_mutex_. Commits nothing unless the driver accepts the
// buffer.
void VideoCamera::update_next_frame_image(const VideoFrameMode& mode, void* buffer) {
    std::shared_ptr<const ImageMap> image;
    if (buffer == nullptr) {
        image = std::make_shared<ImageMap>(mode);
    } else {
        image = std::make_shared<ImageMap>(mode, buffer);
    }

    int result = driver_.set_video_buffer(parent_.handle(), image->data());
    if (result != 0) {
        throw DriverError("Could not set video buffer.", result);
    }

    retired_frame_image_ = std::move(next_frame_image_);
    next_frame_image_ = std::move(image);
}

} // namespace KinectCamera
