#include "context.hpp"
#include "device.hpp"
#include "driver.hpp"
#include "errors.hpp"
#include "test_common.hpp"
#include "fake_driver.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace KinectCamera;
using test::FakeDriver;

// Polls `cond` for up to two seconds.
template <typename Cond>
static bool waitFor(Cond cond) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

int main() {
    std::cout << "=== context_test ===\n";

    std::cout << "\n[Test 0] Context requires a driver\n";
    {
        CHECK_THROWS_AS(Context bad(nullptr), std::invalid_argument);
    }

    std::cout << "\n[Test 1] Event thread pumps the driver until shutdown\n";
    {
        auto driver = std::make_unique<FakeDriver>();
        FakeDriver* fake = driver.get();
        fake->device_total = 3;
        {
            Context context(std::move(driver));
            CHECK(context.device_count() == 3);
            CHECK(context.events_running());
            CHECK(waitFor([fake] { return fake->process_calls > 5; }));
        }
    }

    std::cout << "\n[Test 2] Event pump failure stops the loop and is reported\n";
    {
        auto driver = std::make_unique<FakeDriver>();
        FakeDriver* fake = driver.get();
        Context context(std::move(driver));

        std::atomic<int> codes{0};
        context.set_internal_error_handler([&codes](const std::exception& e) {
            if (auto* driver_error = dynamic_cast<const DriverError*>(&e)) {
                codes = driver_error->code();
            }
        });
        fake->events_result = -4;

        CHECK(waitFor([&context] { return !context.events_running(); }));
        CHECK(waitFor([&codes] { return codes.load() == -4; }));
        CHECK(context.internal_error_count() == 1);
    }

    std::cout << "\n[Test 3] Frames delivered while the event thread runs\n";
    {
        auto driver = std::make_unique<FakeDriver>();
        FakeDriver* fake = driver.get();
        Context context(std::move(driver));
        auto device = context.open_device(0);

        std::atomic<int> events{0};
        device->video_camera().add_data_received_handler(
            [&events](Device&, const DataReceivedEvent&) { ++events; });
        device->video_camera().start();

        std::thread producer([fake, &device] {
            for (uint32_t i = 0; i < 10; ++i) {
                fake->fire_frame_as(device->handle(), device->handle(), nullptr, i);
            }
        });
        // Reconfigure concurrently with delivery
        for (int i = 0; i < 10; ++i) {
            const auto& modes = device->video_camera().modes();
            device->video_camera().set_mode(modes[static_cast<size_t>(i) % modes.size()]);
        }
        producer.join();

        CHECK(events == 10);
        device->video_camera().stop();
        device->close();
        CHECK(context.internal_error_count() == 0);
    }

    std::cout << "\n[Test 4] Driver config sanitising\n";
    {
        DriverConfig cfg;
        cfg.backend = "";
        cfg.poll_interval_ms = 0;
        DriverConfig clean = sanitise(cfg);
        CHECK(clean.backend == "freenect");
        CHECK(clean.poll_interval_ms == 1);

        cfg.poll_interval_ms = 50000;
        CHECK(sanitise(cfg).poll_interval_ms == 1000);
    }

    return test::finish("context_test");
}
