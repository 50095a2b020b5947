/*
 * libcamera_driver.cpp
 *
 * Frames are captured into libcamera-allocated buffers, mapped once at
 * start, and copied row by row (dropping hardware stride padding) into the
 * buffer registered through set_video_buffer() before the callback fires.
 */

#include "libcamera_driver.hpp"
#include "errors.hpp"
#include "frame_mode.hpp"
#include "log.hpp"

#include <libcamera/formats.h>
#include <libcamera/logging.h>
#include <libcamera/pixel_format.h>
#include <libcamera/stream.h>

#include <sys/mman.h>
#include <time.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace KinectCamera {

namespace {

constexpr unsigned int kBufferCount = 4;
constexpr int8_t kNominalFrameRate = 30;

struct FormatInfo {
    VideoFormat format;
    int8_t bits_per_pixel;
};

bool format_info(const libcamera::PixelFormat& pf, FormatInfo& out) {
    namespace f = libcamera::formats;
    if (pf == f::RGB888) {
        out = {VideoFormat::RGB, 24};
    } else if (pf == f::SBGGR8 || pf == f::SGBRG8 || pf == f::SGRBG8 || pf == f::SRGGB8) {
        out = {VideoFormat::Bayer, 8};
    } else if (pf == f::R8) {
        out = {VideoFormat::IR8Bit, 8};
    } else if (pf == f::YUYV) {
        out = {VideoFormat::YUVRaw, 16};
    } else {
        return false;
    }
    return true;
}

int32_t resolution_for(const libcamera::Size& size) {
    if (size.width == 320 && size.height == 240)   return static_cast<int32_t>(Resolution::Low);
    if (size.width == 640 && size.height == 480)   return static_cast<int32_t>(Resolution::Medium);
    if (size.width == 1280 && size.height == 1024) return static_cast<int32_t>(Resolution::High);
    return -1;
}

const char* to_libcamera(DriverLogLevel level) {
    switch (level) {
        case DriverLogLevel::Fatal:   return "FATAL";
        case DriverLogLevel::Error:   return "ERROR";
        case DriverLogLevel::Warning: return "WARN";
        case DriverLogLevel::Notice:
        case DriverLogLevel::Info:    return "INFO";
        case DriverLogLevel::Debug:
        case DriverLogLevel::Spew:
        case DriverLogLevel::Flood:   return "DEBUG";
    }
    return "WARN";
}

// Sensor timestamps count CLOCK_BOOTTIME nanoseconds. Frame callbacks report
// seconds since the Unix epoch, so shift by the current boot-to-wall offset.
uint32_t to_unix_seconds(uint64_t sensor_ns) {
    auto wall = std::chrono::system_clock::now();
    timespec boot{};
    if (sensor_ns != 0 && clock_gettime(CLOCK_BOOTTIME, &boot) == 0) {
        uint64_t boot_ns = static_cast<uint64_t>(boot.tv_sec) * 1000000000ULL +
                           static_cast<uint64_t>(boot.tv_nsec);
        if (sensor_ns <= boot_ns) {
            wall -= std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::nanoseconds(boot_ns - sensor_ns));
        }
    }
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::seconds>(wall.time_since_epoch()).count());
}

} // anonymous namespace

struct LibcameraDriver::CameraSlot {
    struct Mode {
        libcamera::PixelFormat pixel_format;
        libcamera::Size size;
        NativeFrameMode native;
    };

    struct MappedBuffer {
        const libcamera::FrameBuffer* buffer = nullptr;
        uint8_t* map_base = nullptr;
        size_t map_length = 0;
        const uint8_t* data = nullptr;
    };

    int index = -1;
    std::shared_ptr<libcamera::Camera> camera;
    std::unique_ptr<libcamera::CameraConfiguration> config;
    std::unique_ptr<libcamera::FrameBufferAllocator> allocator;
    std::vector<std::unique_ptr<libcamera::Request>> requests;
    std::vector<MappedBuffer> mapped;

    std::vector<Mode> modes;
    int active_mode = -1;
    uint32_t stride = 0;

    std::mutex mutex;
    void* target = nullptr;
    FrameCallback callback;
    std::atomic<bool> streaming{false};
};

LibcameraDriver::LibcameraDriver(const DriverConfig& config)
    : config_(sanitise(config)) {
    libcamera::logSetLevel("*", to_libcamera(config_.log_level));

    cam_mgr_ = std::make_shared<libcamera::CameraManager>();
    int ret = cam_mgr_->start();
    if (ret) {
        throw DriverError("Failed to start CameraManager.", ret);
    }
    LOG_INFO("CameraManager started (" << cam_mgr_->cameras().size() << " cameras)");
}

LibcameraDriver::~LibcameraDriver() {
    std::vector<CameraSlot*> open;
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        for (auto& s : slots_) open.push_back(s.get());
    }
    for (CameraSlot* s : open) {
        int ret = close_device(s);
        if (ret) {
            LOG_WARN("Closing camera " << s->index << " at shutdown returned " << ret);
        }
    }
    if (cam_mgr_) {
        cam_mgr_->stop();
    }
}

LibcameraDriver::CameraSlot& LibcameraDriver::slot(DeviceHandle dev) {
    return *static_cast<CameraSlot*>(dev);
}

int LibcameraDriver::num_devices() {
    return static_cast<int>(cam_mgr_->cameras().size());
}

DeviceHandle LibcameraDriver::open_device(int index) {
    auto cameras = cam_mgr_->cameras();
    if (index < 0 || static_cast<size_t>(index) >= cameras.size()) {
        throw DriverError("Invalid camera index " + std::to_string(index) + ".", -ENODEV);
    }

    auto s = std::make_unique<CameraSlot>();
    s->index = index;
    s->camera = cameras[index];

    int ret = s->camera->acquire();
    if (ret) {
        throw DriverError("Failed to acquire camera " + s->camera->id() + ".", ret);
    }
    LOG_INFO("Camera acquired: " << s->camera->id());

    build_mode_table(*s);
    s->camera->requestCompleted.connect(this, &LibcameraDriver::handle_request_complete);

    std::lock_guard<std::mutex> lock(slots_mutex_);
    slots_.push_back(std::move(s));
    return slots_.back().get();
}

int LibcameraDriver::close_device(DeviceHandle dev) {
    CameraSlot& s = slot(dev);
    if (s.streaming) {
        int ret = stop_video(dev);
        if (ret) {
            LOG_WARN("Stopping camera " << s.index << " on close returned " << ret);
        }
    }

    s.camera->requestCompleted.disconnect(this);
    s.config.reset();
    int ret = s.camera->release();
    LOG_INFO("Camera released: " << s.camera->id());

    std::lock_guard<std::mutex> lock(slots_mutex_);
    for (auto it = slots_.begin(); it != slots_.end(); ++it) {
        if (it->get() == &s) {
            slots_.erase(it);
            break;
        }
    }
    return ret;
}

int LibcameraDriver::process_events() {
    // libcamera completes requests on its own thread
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
    return 0;
}

void LibcameraDriver::build_mode_table(CameraSlot& s) {
    auto config = s.camera->generateConfiguration({libcamera::StreamRole::VideoRecording});
    if (!config || config->empty()) {
        LOG_WARN("Camera " << s.camera->id() << " generated no video configuration");
        return;
    }

    const libcamera::StreamFormats& formats = config->at(0).formats();
    for (const libcamera::PixelFormat& pf : formats.pixelformats()) {
        FormatInfo info{VideoFormat::RGB, 0};
        bool known = format_info(pf, info);

        for (const libcamera::Size& size : formats.sizes(pf)) {
            CameraSlot::Mode mode{pf, size, NativeFrameMode()};
            NativeFrameMode& native = mode.native;
            native.token = static_cast<uint32_t>(s.modes.size());
            native.resolution = resolution_for(size);
            native.format = known ? static_cast<int32_t>(info.format) : -1;
            native.width = static_cast<int16_t>(size.width);
            native.height = static_cast<int16_t>(size.height);
            native.data_bits_per_pixel = info.bits_per_pixel;
            native.padding_bits_per_pixel = 0;
            native.bytes = static_cast<int32_t>(size.width * size.height * info.bits_per_pixel / 8);
            native.framerate = kNominalFrameRate;
            native.is_valid = known && native.resolution >= 0;

            LOG_DEBUG("Mode " << native.token << ": " << pf.toString() << " "
                      << size.width << "x" << size.height
                      << (native.is_valid ? "" : " (unsupported)"));
            s.modes.push_back(mode);
        }
    }
}

void LibcameraDriver::set_video_callback(DeviceHandle dev, FrameCallback callback) {
    CameraSlot& s = slot(dev);
    std::lock_guard<std::mutex> lock(s.mutex);
    s.callback = std::move(callback);
}

int LibcameraDriver::set_video_buffer(DeviceHandle dev, void* buffer) {
    CameraSlot& s = slot(dev);
    // Waits for an in-progress frame copy into the old buffer
    std::lock_guard<std::mutex> lock(s.mutex);
    s.target = buffer;
    return 0;
}

int LibcameraDriver::set_video_mode(DeviceHandle dev, const NativeFrameMode& mode) {
    CameraSlot& s = slot(dev);
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.streaming) {
        return -EBUSY;
    }
    if (mode.token >= s.modes.size() || !s.modes[mode.token].native.is_valid) {
        return -EINVAL;
    }
    const CameraSlot::Mode& wanted = s.modes[mode.token];

    auto config = s.camera->generateConfiguration({libcamera::StreamRole::VideoRecording});
    if (!config) {
        return -EINVAL;
    }
    libcamera::StreamConfiguration& stream_config = config->at(0);
    stream_config.pixelFormat = wanted.pixel_format;
    stream_config.size = wanted.size;
    stream_config.bufferCount = kBufferCount;

    libcamera::CameraConfiguration::Status status = config->validate();
    if (status == libcamera::CameraConfiguration::Invalid) {
        return -EINVAL;
    }
    if (stream_config.pixelFormat != wanted.pixel_format || stream_config.size != wanted.size) {
        LOG_WARN("Camera adjusted " << wanted.pixel_format.toString() << " "
                 << wanted.size.width << "x" << wanted.size.height << " to "
                 << stream_config.toString());
        return -EINVAL;
    }

    int ret = s.camera->configure(config.get());
    if (ret < 0) {
        return ret;
    }

    s.stride = config->at(0).stride;
    s.config = std::move(config);
    s.active_mode = static_cast<int>(mode.token);
    LOG_INFO("Camera " << s.index << " configured: " << s.config->at(0).toString()
             << " stride " << s.stride);
    return 0;
}

int LibcameraDriver::get_video_mode_count(DeviceHandle dev) {
    return static_cast<int>(slot(dev).modes.size());
}

NativeFrameMode LibcameraDriver::get_video_mode(DeviceHandle dev, int index) {
    CameraSlot& s = slot(dev);
    if (index < 0 || static_cast<size_t>(index) >= s.modes.size()) {
        return NativeFrameMode();
    }
    return s.modes[index].native;
}

int LibcameraDriver::allocate_buffers(CameraSlot& s) {
    libcamera::Stream* stream = s.config->at(0).stream();
    s.allocator = std::make_unique<libcamera::FrameBufferAllocator>(s.camera);
    int ret = s.allocator->allocate(stream);
    if (ret < 0) {
        return ret;
    }
    LOG_DEBUG("Allocated " << ret << " buffers for stream");

    for (const auto& buffer : s.allocator->buffers(stream)) {
        const auto& planes = buffer->planes();
        if (planes.empty()) {
            return -EINVAL;
        }
        const auto& first_plane = planes.front();
        const auto& last_plane = planes.back();
        size_t length = last_plane.offset + last_plane.length;

        void* base = mmap(nullptr, length, PROT_READ, MAP_SHARED, first_plane.fd.get(), 0);
        if (base == MAP_FAILED) {
            int err = errno;
            LOG_ERROR("mmap failed: " << std::strerror(err));
            return -err;
        }
        CameraSlot::MappedBuffer mapped;
        mapped.buffer = buffer.get();
        mapped.map_base = static_cast<uint8_t*>(base);
        mapped.map_length = length;
        mapped.data = mapped.map_base + first_plane.offset;
        s.mapped.push_back(mapped);
    }
    return 0;
}

int LibcameraDriver::create_requests(CameraSlot& s) {
    libcamera::Stream* stream = s.config->at(0).stream();
    for (const auto& buffer : s.allocator->buffers(stream)) {
        std::unique_ptr<libcamera::Request> request =
            s.camera->createRequest(reinterpret_cast<uint64_t>(&s));
        if (!request) {
            return -ENOMEM;
        }
        int ret = request->addBuffer(stream, buffer.get());
        if (ret < 0) {
            return ret;
        }
        s.requests.push_back(std::move(request));
    }
    LOG_DEBUG("Created " << s.requests.size() << " requests");
    return 0;
}

void LibcameraDriver::release_buffers(CameraSlot& s) {
    for (const auto& mapped : s.mapped) {
        munmap(mapped.map_base, mapped.map_length);
    }
    s.mapped.clear();
    s.requests.clear();
    s.allocator.reset();
}

int LibcameraDriver::start_video(DeviceHandle dev) {
    CameraSlot& s = slot(dev);
    std::lock_guard<std::mutex> lock(s.mutex);

    if (s.streaming) {
        return 0;
    }
    if (!s.config) {
        return -EINVAL;
    }

    int ret = allocate_buffers(s);
    if (ret == 0) ret = create_requests(s);
    if (ret == 0) ret = s.camera->start();
    if (ret != 0) {
        release_buffers(s);
        return ret;
    }

    s.streaming = true;
    for (auto& request : s.requests) {
        ret = s.camera->queueRequest(request.get());
        if (ret < 0) {
            LOG_ERROR("Failed to queue request: " << ret);
            s.streaming = false;
            s.camera->stop();
            release_buffers(s);
            return ret;
        }
    }
    LOG_INFO("Camera " << s.index << " streaming (" << s.requests.size() << " requests queued)");
    return 0;
}

int LibcameraDriver::stop_video(DeviceHandle dev) {
    CameraSlot& s = slot(dev);
    s.streaming = false;

    // Not under s.mutex: stop() completes pending requests synchronously
    int ret = s.camera->stop();

    std::lock_guard<std::mutex> lock(s.mutex);
    release_buffers(s);
    LOG_INFO("Camera " << s.index << " pipeline stopped");
    return ret;
}

void LibcameraDriver::handle_request_complete(libcamera::Request* request) {
    auto* s = reinterpret_cast<CameraSlot*>(request->cookie());

    if (!s->streaming) return;
    if (request->status() == libcamera::Request::RequestCancelled) return;

    if (request->status() != libcamera::Request::RequestComplete || request->buffers().empty()) {
        LOG_WARN("Request failed (status: " << static_cast<int>(request->status()) << "). Dropping.");
        request->reuse(libcamera::Request::ReuseBuffers);
        s->camera->queueRequest(request);
        return;
    }

    libcamera::FrameBuffer* buffer = request->buffers().begin()->second;

    FrameCallback callback;
    void* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        target = s->target;
        callback = s->callback;

        const CameraSlot::MappedBuffer* mapped = nullptr;
        for (const auto& m : s->mapped) {
            if (m.buffer == buffer) {
                mapped = &m;
                break;
            }
        }

        if (target && mapped && s->active_mode >= 0) {
            const NativeFrameMode& mode = s->modes[s->active_mode].native;
            size_t row_bytes = static_cast<size_t>(mode.width) * mode.data_bits_per_pixel / 8;
            auto* dst = static_cast<uint8_t*>(target);
            for (int y = 0; y < mode.height; ++y) {
                std::memcpy(dst + y * row_bytes, mapped->data + y * s->stride, row_bytes);
            }
        }
    }

    if (callback && target) {
        uint32_t seconds = to_unix_seconds(buffer->metadata().timestamp);
        try {
            callback(s, target, seconds);
        } catch (const std::exception& e) {
            LOG_ERROR("Video frame handler failed: " << e.what());
        }
    }

    request->reuse(libcamera::Request::ReuseBuffers);
    if (s->streaming) {
        s->camera->queueRequest(request);
    }
}

} // namespace KinectCamera
