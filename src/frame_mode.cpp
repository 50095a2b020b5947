/*
 * frame_mode.cpp
 */

#include "frame_mode.hpp"

#include <sstream>

namespace KinectCamera {

namespace {

bool known_format(int32_t value) {
    return value >= static_cast<int32_t>(VideoFormat::RGB) &&
           value <= static_cast<int32_t>(VideoFormat::YUVRaw);
}

bool known_resolution(int32_t value) {
    return value >= static_cast<int32_t>(Resolution::Low) &&
           value <= static_cast<int32_t>(Resolution::High);
}

} // anonymous namespace

const char* to_string(VideoFormat format) {
    switch (format) {
        case VideoFormat::RGB:           return "RGB";
        case VideoFormat::Bayer:         return "Bayer";
        case VideoFormat::IR8Bit:        return "IR8Bit";
        case VideoFormat::IR10Bit:       return "IR10Bit";
        case VideoFormat::IR10BitPacked: return "IR10BitPacked";
        case VideoFormat::YUVRGB:        return "YUVRGB";
        case VideoFormat::YUVRaw:        return "YUVRaw";
    }
    return "Unknown";
}

const char* to_string(Resolution resolution) {
    switch (resolution) {
        case Resolution::Low:    return "Low";
        case Resolution::Medium: return "Medium";
        case Resolution::High:   return "High";
    }
    return "Unknown";
}

std::optional<VideoFrameMode> VideoFrameMode::from_native(const NativeFrameMode& native) {
    if (!native.is_valid) {
        return std::nullopt;
    }
    if (!known_format(native.format) || !known_resolution(native.resolution)) {
        return std::nullopt;
    }
    if (native.bytes <= 0 || native.width <= 0 || native.height <= 0) {
        return std::nullopt;
    }
    return VideoFrameMode(static_cast<VideoFormat>(native.format),
                          static_cast<Resolution>(native.resolution),
                          native);
}

const VideoFrameMode* VideoFrameMode::find(const std::vector<VideoFrameMode>& modes,
                                           VideoFormat format,
                                           Resolution resolution) {
    for (const auto& mode : modes) {
        if (mode.format_ == format && mode.resolution_ == resolution) {
            return &mode;
        }
    }
    return nullptr;
}

std::string VideoFrameMode::to_string() const {
    std::ostringstream out;
    out << "[" << KinectCamera::to_string(format_) << ", "
        << KinectCamera::to_string(resolution_) << "] "
        << width() << "x" << height() << " @ " << frame_rate() << " fps";
    return out.str();
}

} // namespace KinectCamera
