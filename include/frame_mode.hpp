/*
 * frame_mode.hpp
 *
 * Semantic video mode (pixel format + resolution) built from a native
 * mode descriptor.
 */

#ifndef KINECT_CAMERA_FRAME_MODE_HPP
#define KINECT_CAMERA_FRAME_MODE_HPP

#include "driver.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace KinectCamera {

// Values match freenect_video_format.
enum class VideoFormat {
    RGB = 0,
    Bayer = 1,
    IR8Bit = 2,
    IR10Bit = 3,
    IR10BitPacked = 4,
    YUVRGB = 5,
    YUVRaw = 6,
};

// Values match freenect_resolution.
enum class Resolution {
    Low = 0,     // 320x240
    Medium = 1,  // 640x480
    High = 2,    // 1280x1024
};

const char* to_string(VideoFormat format);
const char* to_string(Resolution resolution);

class VideoFrameMode {
public:
    VideoFrameMode() = default;

    /**
     * @brief Converts a driver descriptor.
     * @return empty if the descriptor is flagged invalid or carries a
     * format/resolution value this library does not know
     */
    static std::optional<VideoFrameMode> from_native(const NativeFrameMode& native);

    /**
     * @brief Looks a mode up by format and resolution.
     * @return pointer into `modes`, or nullptr if absent
     */
    static const VideoFrameMode* find(const std::vector<VideoFrameMode>& modes,
                                      VideoFormat format,
                                      Resolution resolution);

    VideoFormat format() const { return format_; }
    Resolution resolution() const { return resolution_; }
    int width() const { return native_.width; }
    int height() const { return native_.height; }
    int frame_rate() const { return native_.framerate; }
    int data_bits_per_pixel() const { return native_.data_bits_per_pixel; }
    int padding_bits_per_pixel() const { return native_.padding_bits_per_pixel; }

    // Size in bytes of one frame in this mode.
    size_t bytes() const { return static_cast<size_t>(native_.bytes); }

    const NativeFrameMode& native() const { return native_; }

    std::string to_string() const;

    // Modes are the same when format and resolution match.
    bool operator==(const VideoFrameMode& other) const {
        return format_ == other.format_ && resolution_ == other.resolution_;
    }
    bool operator!=(const VideoFrameMode& other) const { return !(*this == other); }

private:
    VideoFrameMode(VideoFormat format, Resolution resolution, const NativeFrameMode& native)
        : format_(format), resolution_(resolution), native_(native) {}

    VideoFormat format_ = VideoFormat::RGB;
    Resolution resolution_ = Resolution::Medium;
    NativeFrameMode native_{};
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_FRAME_MODE_HPP
