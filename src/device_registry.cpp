/*
 * device_registry.cpp
 */

#include "device_registry.hpp"
#include "device.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <sstream>

namespace KinectCamera {

namespace {

std::string describe(DeviceHandle handle) {
    std::ostringstream out;
    out << handle;
    return out.str();
}

} // anonymous namespace

void DeviceRegistry::insert(DeviceHandle handle, Device* device) {
    if (!handle || !device) {
        throw std::logic_error("Cannot register a null device handle");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!devices_.emplace(handle, device).second) {
        throw std::logic_error("Device handle " + describe(handle) + " is already registered");
    }
    LOG_DEBUG("Registered device handle " << handle);
}

void DeviceRegistry::remove(DeviceHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.erase(handle) == 0) {
        LOG_WARN("Removing unregistered device handle " << handle);
        return;
    }
    LOG_DEBUG("Unregistered device handle " << handle);
}

Device& DeviceRegistry::resolve(DeviceHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(handle);
    if (it == devices_.end()) {
        throw RegistryDesync("No device registered for handle " + describe(handle));
    }
    return *it->second;
}

bool DeviceRegistry::contains(DeviceHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.count(handle) != 0;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

void dispatch_video_frame(const DeviceRegistry& registry,
                          DeviceHandle handle,
                          void* data,
                          uint32_t timestamp) {
    Device& device = registry.resolve(handle);
    device.video_camera().deliver_frame(data, timestamp);
}

} // namespace KinectCamera
