#include "context.hpp"
#include "device.hpp"
#include "errors.hpp"
#include "video_camera.hpp"
#include "test_common.hpp"
#include "fake_driver.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace KinectCamera;
using test::FakeDriver;

namespace {

struct Fixture {
    FakeDriver* fake = nullptr;
    std::unique_ptr<Context> context;
    std::unique_ptr<Device> device;

    Fixture() {
        auto driver = std::make_unique<FakeDriver>();
        fake = driver.get();
        ContextConfig cfg;
        cfg.start_event_thread = false;
        context = std::make_unique<Context>(std::move(driver), cfg);
        device = context->open_device(0);
    }

    VideoCamera& camera() { return device->video_camera(); }
    FakeDriver::FakeDevice& native() { return FakeDriver::device(device->handle()); }
};

struct Received {
    Device* sender;
    DataReceivedEvent event;
};

VideoFrameMode modeOf(VideoFormat format, Resolution resolution, int w, int h, int bits) {
    return *VideoFrameMode::from_native(FakeDriver::make_mode(format, resolution, w, h, bits));
}

} // anonymous namespace

int main() {
    std::cout << "=== video_camera_test ===\n";

    std::cout << "\n[Test 0] Construction enumerates modes and applies the first\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        CHECK(f.fake->mode_count_calls == 1);
        CHECK(cam.modes().size() == 5);
        CHECK(cam.mode() == modeOf(VideoFormat::RGB, Resolution::Medium, 640, 480, 24));
        CHECK(f.native().mode_calls == 1);
        CHECK(static_cast<bool>(f.native().callback));
        CHECK(!cam.is_running());
        CHECK(cam.data_buffer() == nullptr);

        auto image = cam.next_frame_image();
        CHECK(image != nullptr);
        if (image) {
            CHECK(image->owns_data());
            CHECK(image->size() == 640u * 480u * 3u);
            CHECK(f.native().buffer == image->data());
        }
    }

    std::cout << "\n[Test 1] Every enumerated mode can be applied\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        std::vector<VideoFrameMode> modes = cam.modes();
        for (const auto& mode : modes) {
            cam.set_mode(mode);
            CHECK(cam.mode() == mode);
            CHECK(f.native().mode.format == static_cast<int32_t>(mode.format()));
            CHECK(f.native().mode.resolution == static_cast<int32_t>(mode.resolution()));
            auto image = cam.next_frame_image();
            CHECK(image->size() == mode.bytes());
            CHECK(f.native().buffer == image->data());
        }
        CHECK(f.native().mode_calls == 1 + static_cast<int>(modes.size()));
    }

    std::cout << "\n[Test 2] Unknown mode is rejected before the driver is called\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        VideoFrameMode bayer = modeOf(VideoFormat::Bayer, Resolution::Medium, 640, 480, 8);
        cam.set_mode(bayer);
        int calls = f.native().mode_calls;
        auto image = cam.next_frame_image();

        CHECK_THROWS_AS(cam.set_mode(modeOf(VideoFormat::IR10Bit, Resolution::Medium, 640, 488, 16)),
                        ConfigurationRejected);
        CHECK_THROWS_AS(cam.set_mode(modeOf(VideoFormat::Bayer, Resolution::High, 1280, 1024, 8)),
                        ConfigurationRejected);
        CHECK(cam.mode() == bayer);
        CHECK(f.native().mode_calls == calls);
        CHECK(cam.next_frame_image() == image);
    }

    std::cout << "\n[Test 3] Driver refusing a mode switch keeps the old mode\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        VideoFrameMode before = cam.mode();
        void* buffer_before = f.native().buffer;

        f.fake->mode_result = -5;
        int code = 0;
        try {
            cam.set_mode(modeOf(VideoFormat::RGB, Resolution::High, 1280, 1024, 24));
        } catch (const DriverError& e) {
            code = e.code();
        }
        CHECK(code == -5);
        CHECK(cam.mode() == before);
        CHECK(f.native().buffer == buffer_before);
    }

    std::cout << "\n[Test 4] Running flag follows successful start/stop only\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();

        cam.start();
        CHECK(cam.is_running());
        CHECK(f.native().start_calls == 1);
        cam.stop();
        CHECK(!cam.is_running());

        f.fake->start_result = -1;
        int code = 0;
        try {
            cam.start();
        } catch (const DriverError& e) {
            code = e.code();
        }
        CHECK(code == -1);
        CHECK(!cam.is_running());

        f.fake->start_result = 0;
        cam.start();
        f.fake->stop_result = -9;
        CHECK_THROWS_AS(cam.stop(), DriverError);
        CHECK(cam.is_running());

        f.fake->stop_result = 0;
        cam.stop();
        CHECK(!cam.is_running());
        // Flag-level idempotence
        cam.stop();
        CHECK(!cam.is_running());
    }

    std::cout << "\n[Test 5] Start re-registers a fresh frame buffer\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        size_t registrations = f.native().buffer_history.size();
        cam.start();
        CHECK(f.native().buffer_history.size() == registrations + 1);
        CHECK(f.native().buffer == cam.next_frame_image()->data());
        cam.stop();
    }

    std::cout << "\n[Test 6] Caller-owned buffer and back to library-managed\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        std::vector<uint8_t> mine(cam.mode().bytes());

        cam.set_data_buffer(nullptr);
        CHECK(cam.next_frame_image()->owns_data());

        cam.set_data_buffer(mine.data());
        CHECK(cam.data_buffer() == mine.data());
        CHECK(f.native().buffer == mine.data());
        CHECK(!cam.next_frame_image()->owns_data());
        CHECK(cam.next_frame_image()->data() == mine.data());

        // Survives a mode change
        cam.set_mode(modeOf(VideoFormat::Bayer, Resolution::Medium, 640, 480, 8));
        CHECK(f.native().buffer == mine.data());

        cam.set_data_buffer(nullptr);
        CHECK(cam.data_buffer() == nullptr);
        CHECK(f.native().buffer != mine.data());
        CHECK(cam.next_frame_image()->owns_data());
        CHECK(f.native().buffer == cam.next_frame_image()->data());
    }

    std::cout << "\n[Test 7] Frame callback raises exactly one event\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        std::vector<Received> received;
        cam.add_data_received_handler([&received](Device& sender, const DataReceivedEvent& e) {
            received.push_back({&sender, e});
        });

        cam.start();
        f.fake->fire_frame(f.device->handle(), 1000);

        CHECK(received.size() == 1);
        if (received.size() == 1) {
            const Received& r = received.front();
            CHECK(r.sender == f.device.get());
            CHECK(r.event.timestamp.time_since_epoch() == std::chrono::seconds(1000));
            CHECK(r.event.timestamp == std::chrono::system_clock::time_point(std::chrono::seconds(1000)));
            CHECK(r.event.image == cam.next_frame_image());
        }
        CHECK(f.context->internal_error_count() == 0);
    }

    std::cout << "\n[Test 8] Frame written before a buffer swap references the old buffer\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        std::vector<DataReceivedEvent> events;
        cam.add_data_received_handler([&events](Device&, const DataReceivedEvent& e) {
            events.push_back(e);
        });

        auto old_image = cam.next_frame_image();
        std::vector<uint8_t> mine(cam.mode().bytes());
        cam.set_data_buffer(mine.data());

        // Late frame for the old buffer, then one for the new
        f.fake->fire_frame_as(f.device->handle(), f.device->handle(), old_image->data(), 1);
        f.fake->fire_frame(f.device->handle(), 2);

        CHECK(events.size() == 2);
        if (events.size() == 2) {
            CHECK(events[0].image == old_image);
            CHECK(events[1].image == cam.next_frame_image());
            CHECK(events[1].image->data() == mine.data());
        }
    }

    std::cout << "\n[Test 9] Handler removal and reconfiguration from a handler\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        int first = 0;
        int second = 0;
        int id = cam.add_data_received_handler([&first](Device&, const DataReceivedEvent&) { ++first; });
        cam.add_data_received_handler([&second, &cam](Device&, const DataReceivedEvent&) {
            ++second;
            cam.set_mode(cam.modes().back());
        });

        f.fake->fire_frame(f.device->handle(), 3);
        cam.remove_data_received_handler(id);
        f.fake->fire_frame(f.device->handle(), 4);

        CHECK(first == 1);
        CHECK(second == 2);
        CHECK(cam.mode() == cam.modes().back());
        CHECK_THROWS_AS(cam.add_data_received_handler(nullptr), std::invalid_argument);
    }

    std::cout << "\n[Test 10] Closing a streaming device stops it and drops the callback\n";
    {
        Fixture f;
        f.camera().start();
        FakeDriver::FakeDevice& native = f.native();
        f.device->close();
        CHECK(native.stop_calls == 1);
        CHECK(!native.streaming);
        CHECK(!native.callback);
        CHECK(!native.open);
        CHECK(f.context->registry().size() == 0);
        CHECK_THROWS_AS(f.device->video_camera(), std::runtime_error);
        // Second close is a no-op
        f.device->close();
    }

    std::cout << "\n[Test 11] Buffer rejected during a mode switch restores the old mode\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        VideoFrameMode before = cam.mode();
        auto image = cam.next_frame_image();
        int calls = f.native().mode_calls;

        f.fake->buffer_result = -7;
        int code = 0;
        try {
            cam.set_mode(modeOf(VideoFormat::RGB, Resolution::High, 1280, 1024, 24));
        } catch (const DriverError& e) {
            code = e.code();
        }
        CHECK(code == -7);
        CHECK(cam.mode() == before);
        // Switched to High, then back
        CHECK(f.native().mode_calls == calls + 2);
        CHECK(f.native().mode.width == 640);
        CHECK(f.native().mode.resolution == static_cast<int32_t>(Resolution::Medium));
        CHECK(cam.next_frame_image() == image);
        CHECK(f.native().buffer == image->data());
        CHECK(image->size() == cam.mode().bytes());

        f.fake->buffer_result = 0;
        cam.set_mode(modeOf(VideoFormat::RGB, Resolution::High, 1280, 1024, 24));
        CHECK(cam.mode().resolution() == Resolution::High);
        CHECK(cam.next_frame_image()->size() == 1280u * 1024u * 3u);
        CHECK(f.native().buffer == cam.next_frame_image()->data());
    }

    std::cout << "\n[Test 12] Caller buffer rejected by the driver is not adopted\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        auto image = cam.next_frame_image();
        std::vector<uint8_t> mine(cam.mode().bytes());

        f.fake->buffer_result = -7;
        int code = 0;
        try {
            cam.set_data_buffer(mine.data());
        } catch (const DriverError& e) {
            code = e.code();
        }
        CHECK(code == -7);
        CHECK(cam.data_buffer() == nullptr);
        CHECK(cam.next_frame_image() == image);
        CHECK(f.native().buffer == image->data());

        // The next start must not retry the rejected pointer
        f.fake->buffer_result = 0;
        cam.start();
        CHECK(f.native().buffer != mine.data());
        CHECK(cam.next_frame_image()->owns_data());
        cam.stop();
    }

    std::cout << "\n[Test 13] Close waits for a running frame handler\n";
    {
        Fixture f;
        VideoCamera& cam = f.camera();
        std::atomic<bool> entered{false};
        std::atomic<bool> finished{false};
        std::atomic<int> events{0};
        cam.add_data_received_handler([&](Device&, const DataReceivedEvent&) {
            ++events;
            entered = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            finished = true;
        });
        cam.start();

        DeviceHandle handle = f.device->handle();
        FrameCallback callback = f.fake->callback_of(handle);
        std::thread driver_thread([callback, handle] { callback(handle, nullptr, 5); });

        while (!entered) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        f.device->close();
        CHECK(finished);
        driver_thread.join();

        // A callback copy that fires after close is reported, not delivered
        uint64_t before = f.context->internal_error_count();
        callback(handle, nullptr, 6);
        CHECK(events == 1);
        CHECK(f.context->internal_error_count() == before + 1);
    }

    std::cout << "\n[Test 14] Closing a device from its own handler is rejected\n";
    {
        Fixture f;
        bool rejected = false;
        f.camera().add_data_received_handler([&rejected](Device& sender, const DataReceivedEvent&) {
            try {
                sender.close();
            } catch (const std::logic_error&) {
                rejected = true;
            }
        });

        f.fake->fire_frame(f.device->handle(), 7);
        CHECK(rejected);
        CHECK(f.device->is_open());
        CHECK(f.context->registry().size() == 1);
        CHECK(static_cast<bool>(f.native().callback));

        f.device->close();
        CHECK(!f.device->is_open());
    }

    return test::finish("video_camera_test");
}
