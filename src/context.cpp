/*
 * context.cpp
 */

#include "context.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace KinectCamera {

Context::Context(std::unique_ptr<Driver> driver, const ContextConfig& config)
    : driver_(std::move(driver)) {
    if (!driver_) {
        throw std::invalid_argument("Context requires a driver");
    }
    if (config.debug) {
        enable_debug(true);
    }
    LOG_INFO("Context created with " << driver_->name() << " driver");

    if (config.start_event_thread) {
        events_running_ = true;
        event_thread_ = std::make_unique<std::thread>(&Context::event_loop, this);
    }
}

Context::~Context() {
    LOG_INFO("Shutting down...");
    stop_event_thread();
    if (registry_.size() != 0) {
        LOG_WARN(registry_.size() << " device(s) still open at context shutdown");
    }
}

int Context::device_count() {
    return driver_->num_devices();
}

std::unique_ptr<Device> Context::open_device(int index) {
    int count = device_count();
    if (index < 0 || index >= count) {
        throw std::out_of_range("Invalid device index: " + std::to_string(index) +
                                " (" + std::to_string(count) + " devices)");
    }
    return std::make_unique<Device>(*this, index);
}

void Context::report_internal_error(const std::exception& error) {
    internal_errors_++;
    LOG_ERROR("Internal error: " << error.what());

    InternalErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        handler = error_handler_;
    }
    if (handler) {
        handler(error);
    }
}

void Context::set_internal_error_handler(InternalErrorHandler handler) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_handler_ = std::move(handler);
}

void Context::event_loop() {
    LOG_DEBUG("Event loop started");
    while (events_running_) {
        int result = driver_->process_events();
        if (result < 0) {
            events_running_ = false;
            report_internal_error(DriverError("Driver event processing failed.", result));
            break;
        }
    }
    LOG_DEBUG("Event loop ended");
}

void Context::stop_event_thread() {
    events_running_ = false;
    if (event_thread_ && event_thread_->joinable()) {
        event_thread_->join();
    }
    event_thread_.reset();
}

} // namespace KinectCamera
