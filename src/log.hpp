/*
 * log.hpp
 *
 * Internal logging macros. Each line is formatted first and written with a
 * single stream insertion so lines from the driver thread do not interleave.
 */

#ifndef KINECT_CAMERA_LOG_HPP
#define KINECT_CAMERA_LOG_HPP

#include "logging.hpp"

#include <iostream>
#include <sstream>

#define KINECT_LOG_LINE(stream, tag, msg)                 \
    do {                                                  \
        std::ostringstream log_line_;                     \
        log_line_ << tag << msg << '\n';                  \
        stream << log_line_.str() << std::flush;          \
    } while (0)

#define LOG_INFO(msg)   KINECT_LOG_LINE(std::cout, "[INFO]  ", msg)
#define LOG_DEBUG(msg)  do { if (::KinectCamera::debug_enabled()) KINECT_LOG_LINE(std::cout, "[DEBUG] ", msg); } while (0)
#define LOG_WARN(msg)   KINECT_LOG_LINE(std::cerr, "[WARN]  ", msg)
#define LOG_ERROR(msg)  KINECT_LOG_LINE(std::cerr, "[ERROR] ", msg)

#endif // KINECT_CAMERA_LOG_HPP
