/*
 * context.hpp
 *
 * Process-wide device manager: owns the driver, the handle registry and the
 * thread that pumps driver events.
 */

#ifndef KINECT_CAMERA_CONTEXT_HPP
#define KINECT_CAMERA_CONTEXT_HPP

#include "device.hpp"
#include "device_registry.hpp"
#include "driver.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace KinectCamera {

struct ContextConfig {
    bool debug = false;

    // Run Driver::process_events() on a background thread. Frame callbacks
    // from libfreenect only fire while events are pumped.
    bool start_event_thread = true;
};

class Context {
public:
    using InternalErrorHandler = std::function<void(const std::exception&)>;

    explicit Context(std::unique_ptr<Driver> driver, const ContextConfig& config = ContextConfig());
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    int device_count();

    /**
     * @brief Opens device `index`. The Context must outlive the Device.
     * @throws DriverError if the driver cannot open it
     */
    std::unique_ptr<Device> open_device(int index);

    Driver& driver() { return *driver_; }
    DeviceRegistry& registry() { return registry_; }
    const DeviceRegistry& registry() const { return registry_; }

    /**
     * @brief Records a failure that cannot propagate to a caller, such as a
     * frame callback for an unknown handle. Logged, counted and forwarded to
     * the handler. Called from driver threads.
     */
    void report_internal_error(const std::exception& error);
    void set_internal_error_handler(InternalErrorHandler handler);
    uint64_t internal_error_count() const { return internal_errors_; }

    bool events_running() const { return events_running_; }

private:
    void event_loop();
    void stop_event_thread();

    std::unique_ptr<Driver> driver_;
    DeviceRegistry registry_;

    std::unique_ptr<std::thread> event_thread_;
    std::atomic<bool> events_running_{false};

    std::mutex error_mutex_;
    InternalErrorHandler error_handler_;
    std::atomic<uint64_t> internal_errors_{0};
};

} // namespace KinectCamera

#endif // KINECT_CAMERA_CONTEXT_HPP
