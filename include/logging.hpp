/*
 * logging.hpp
 *
 * Process-wide logging switches for the kinect_camera library.
 */

#ifndef KINECT_CAMERA_LOGGING_HPP
#define KINECT_CAMERA_LOGGING_HPP

namespace KinectCamera {

// Enables or disables [DEBUG] output from every library component.
void enable_debug(bool enable);
bool debug_enabled();

} // namespace KinectCamera

#endif // KINECT_CAMERA_LOGGING_HPP
