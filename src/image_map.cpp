/*
 * image_map.cpp
 */

#include "image_map.hpp"

#include <stdexcept>

namespace KinectCamera {

ImageMap::ImageMap(const VideoFrameMode& mode)
    : mode_(mode), storage_(mode.bytes(), 0) {
    if (storage_.empty()) {
        throw std::invalid_argument("Cannot allocate image for zero-sized mode " + mode.to_string());
    }
    data_ = storage_.data();
}

ImageMap::ImageMap(const VideoFrameMode& mode, void* external)
    : mode_(mode), data_(external) {
    if (!external) {
        throw std::invalid_argument("Null pointer passed as external image buffer");
    }
}

size_t ImageMap::stride() const {
    if (mode_.height() <= 0) {
        return 0;
    }
    return size() / static_cast<size_t>(mode_.height());
}

} // namespace KinectCamera
