/*
 * image_map.hpp
 *
 * Frame buffer wrapper handed to the driver and delivered with each
 * frame event.
 */

#ifndef KINECT_CAMERA_IMAGE_MAP_HPP
#define KINECT_CAMERA_IMAGE_MAP_HPP

#include "frame_mode.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace KinectCamera {

class ImageMap {
public:
    // Allocates and owns mode.bytes() zeroed bytes.
    explicit ImageMap(const VideoFrameMode& mode);

    /**
     * @brief Wraps caller-owned memory. The caller keeps it alive and large
     * enough for mode.bytes(); nothing is copied or checked.
     */
    ImageMap(const VideoFrameMode& mode, void* external);

    ImageMap(const ImageMap&) = delete;
    ImageMap& operator=(const ImageMap&) = delete;

    void* data() const { return data_; }
    size_t size() const { return mode_.bytes(); }
    bool owns_data() const { return !storage_.empty(); }

    const VideoFrameMode& mode() const { return mode_; }
    int width() const { return mode_.width(); }
    int height() const { return mode_.height(); }

    // Bytes from the start of one row to the next.
    size_t stride() const;

private:
    VideoFrameMode mode_;
    std::vector<uint8_t> storage_;
    void* data_ = nullptr;
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_IMAGE_MAP_HPP
