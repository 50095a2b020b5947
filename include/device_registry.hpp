/*
 * device_registry.hpp
 *
 * Handle -> Device map owned by the Context. A Device is inserted when its
 * driver handle is opened and removed before the handle is closed.
 */

#ifndef KINECT_CAMERA_DEVICE_REGISTRY_HPP
#define KINECT_CAMERA_DEVICE_REGISTRY_HPP

#include "driver.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace KinectCamera {

class Device;

class DeviceRegistry {
public:
    // @throws std::logic_error if the handle is null or already registered
    void insert(DeviceHandle handle, Device* device);
    void remove(DeviceHandle handle);

    /**
     * @brief Finds the Device owning `handle`.
     * @throws RegistryDesync if no Device is registered for it
     */
    Device& resolve(DeviceHandle handle) const;

    bool contains(DeviceHandle handle) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<DeviceHandle, Device*> devices_;
};

/**
 * @brief Routes one driver frame callback to the owning VideoCamera.
 *
 * Converts `timestamp` (seconds since the Unix epoch) to a time point and
 * raises the camera's DataReceived event synchronously on the calling thread.
 *
 * @throws RegistryDesync if `handle` is not registered; no event is raised
 */
void dispatch_video_frame(const DeviceRegistry& registry,
                          DeviceHandle handle,
                          void* data,
                          uint32_t timestamp);

} // namespace KinectCamera

#endif // KINECT_CAMERA_DEVICE_REGISTRY_HPP
