/*
 * pybind_kinect.cpp
 *
 * Pybind11 wrapper definitions for the kinect_camera library.
 *
 * DataReceived handlers run on the driver thread; they take the GIL for the
 * duration of the Python call. Every call that may wait on the driver or on
 * that thread releases the GIL first.
 */

#include "context.hpp"
#include "device.hpp"
#include "driver.hpp"
#include "errors.hpp"
#include "frame_mode.hpp"
#include "image_map.hpp"
#include "logging.hpp"
#include "video_camera.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/operators.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>

namespace py = pybind11;
using namespace KinectCamera;

namespace {

// Destroying a Context or Device joins/stops driver work that may itself be
// waiting for the GIL inside a handler.
struct ReleaseGilDelete {
    template <typename T>
    void operator()(T* ptr) const {
        py::gil_scoped_release release_gil;
        delete ptr;
    }
};

using ContextHolder = std::unique_ptr<Context, ReleaseGilDelete>;
using DeviceHolder = std::unique_ptr<Device, ReleaseGilDelete>;

// The last reference to a Python callable may be dropped on a driver thread.
struct AcquireGilDelete {
    void operator()(py::function* fn) const {
        py::gil_scoped_acquire acquire_gil;
        delete fn;
    }
};

std::shared_ptr<py::function> hold_callable(py::function fn) {
    return std::shared_ptr<py::function>(
        std::make_unique<py::function>(std::move(fn)).release(), AcquireGilDelete());
}

} // anonymous namespace

PYBIND11_MODULE(kinect_camera, m) {
    m.doc() = "kinect_camera: video stream adapter over libfreenect / libcamera drivers";

    // --- Exceptions ---
    py::register_exception<ConfigurationRejected>(m, "ConfigurationRejected", PyExc_ValueError);
    py::register_exception<RegistryDesync>(m, "RegistryDesync", PyExc_RuntimeError);
    static py::exception<DriverError> driver_error(m, "DriverError", PyExc_RuntimeError);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const DriverError& e) {
            py::object type = py::reinterpret_borrow<py::object>(driver_error.ptr());
            py::object instance = type(e.what());
            instance.attr("code") = e.code();
            PyErr_SetObject(driver_error.ptr(), instance.ptr());
        }
    });

    // --- Enums ---
    py::enum_<VideoFormat>(m, "VideoFormat")
        .value("RGB", VideoFormat::RGB)
        .value("Bayer", VideoFormat::Bayer)
        .value("IR8Bit", VideoFormat::IR8Bit)
        .value("IR10Bit", VideoFormat::IR10Bit)
        .value("IR10BitPacked", VideoFormat::IR10BitPacked)
        .value("YUVRGB", VideoFormat::YUVRGB)
        .value("YUVRaw", VideoFormat::YUVRaw);

    py::enum_<Resolution>(m, "Resolution")
        .value("Low", Resolution::Low)
        .value("Medium", Resolution::Medium)
        .value("High", Resolution::High);

    py::enum_<DriverLogLevel>(m, "DriverLogLevel")
        .value("Fatal", DriverLogLevel::Fatal)
        .value("Error", DriverLogLevel::Error)
        .value("Warning", DriverLogLevel::Warning)
        .value("Notice", DriverLogLevel::Notice)
        .value("Info", DriverLogLevel::Info)
        .value("Debug", DriverLogLevel::Debug)
        .value("Spew", DriverLogLevel::Spew)
        .value("Flood", DriverLogLevel::Flood);

    m.def("enable_debug", &enable_debug, py::arg("enable"), "Enable or disable debug logging");

    // --- Value types ---
    py::class_<VideoFrameMode>(m, "VideoFrameMode")
        .def_property_readonly("format", &VideoFrameMode::format)
        .def_property_readonly("resolution", &VideoFrameMode::resolution)
        .def_property_readonly("width", &VideoFrameMode::width)
        .def_property_readonly("height", &VideoFrameMode::height)
        .def_property_readonly("bytes", &VideoFrameMode::bytes)
        .def_property_readonly("frame_rate", &VideoFrameMode::frame_rate)
        .def_property_readonly("data_bits_per_pixel", &VideoFrameMode::data_bits_per_pixel)
        .def_property_readonly("padding_bits_per_pixel", &VideoFrameMode::padding_bits_per_pixel)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", &VideoFrameMode::to_string);

    py::class_<ImageMap, std::shared_ptr<ImageMap>>(m, "ImageMap", py::buffer_protocol())
        .def_property_readonly("width", &ImageMap::width)
        .def_property_readonly("height", &ImageMap::height)
        .def_property_readonly("size", &ImageMap::size)
        .def_property_readonly("stride", &ImageMap::stride)
        .def_property_readonly("owns_data", &ImageMap::owns_data)
        .def_property_readonly("mode", &ImageMap::mode)
        .def_property_readonly("data_pointer", [](const ImageMap& img) {
            return reinterpret_cast<uintptr_t>(img.data());
        })
        .def_buffer([](ImageMap& img) {
            return py::buffer_info(img.data(),
                                   1,
                                   py::format_descriptor<uint8_t>::format(),
                                   1,
                                   {static_cast<py::ssize_t>(img.size())},
                                   {static_cast<py::ssize_t>(1)},
                                   true);
        });

    py::class_<DataReceivedEvent>(m, "DataReceivedEvent")
        .def_readonly("timestamp", &DataReceivedEvent::timestamp)
        .def_property_readonly("image", [](const DataReceivedEvent& e) {
            return std::const_pointer_cast<ImageMap>(e.image);
        });

    // --- VideoCamera ---
    py::class_<VideoCamera>(m, "VideoCamera")
        .def("start", &VideoCamera::start, py::call_guard<py::gil_scoped_release>(),
             "Starts streaming video data from this camera")
        .def("stop", &VideoCamera::stop, py::call_guard<py::gil_scoped_release>(),
             "Stops streaming video data from this camera")
        .def_property_readonly("is_running", &VideoCamera::is_running)
        .def_property("mode",
            &VideoCamera::mode,
            [](VideoCamera& cam, const VideoFrameMode& mode) {
                py::gil_scoped_release release_gil;
                cam.set_mode(mode);
            },
            "Current video mode; must be one of `modes`")
        .def_property_readonly("modes", &VideoCamera::modes)
        .def_property("data_buffer",
            [](const VideoCamera& cam) {
                return reinterpret_cast<uintptr_t>(cam.data_buffer());
            },
            [](VideoCamera& cam, uintptr_t address) {
                py::gil_scoped_release release_gil;
                cam.set_data_buffer(reinterpret_cast<void*>(address));
            },
            "Address of a caller-owned frame buffer; 0 lets the library manage it")
        .def_property_readonly("next_frame_image", [](const VideoCamera& cam) {
            return std::const_pointer_cast<ImageMap>(cam.next_frame_image());
        })
        .def("add_data_received_handler",
            [](VideoCamera& cam, py::function fn) {
                auto callable = hold_callable(std::move(fn));
                return cam.add_data_received_handler(
                    [callable](Device& device, const DataReceivedEvent& event) {
                        py::gil_scoped_acquire acquire_gil;
                        try {
                            (*callable)(py::cast(&device, py::return_value_policy::reference), event);
                        } catch (py::error_already_set& e) {
                            e.discard_as_unraisable("kinect_camera DataReceived handler");
                        }
                    });
            },
            py::arg("handler"),
            "Registers handler(device, event); called on the driver thread. Returns an id")
        .def("remove_data_received_handler", &VideoCamera::remove_data_received_handler,
             py::arg("handler_id"));

    // --- Device ---
    py::class_<Device, DeviceHolder>(m, "Device")
        .def_property_readonly("index", &Device::index)
        .def_property_readonly("is_open", &Device::is_open)
        .def_property_readonly("video_camera", &Device::video_camera,
                               py::return_value_policy::reference_internal)
        .def("close", &Device::close, py::call_guard<py::gil_scoped_release>(),
             "Stops the camera and closes the device");

    // --- Context ---
    py::class_<Context, ContextHolder>(m, "Context")
        .def(py::init([](const std::string& backend, bool debug,
                         DriverLogLevel log_level, int poll_interval_ms) {
                 DriverConfig driver_config;
                 driver_config.backend = backend;
                 driver_config.log_level = log_level;
                 driver_config.poll_interval_ms = poll_interval_ms;

                 ContextConfig context_config;
                 context_config.debug = debug;

                 py::gil_scoped_release release_gil;
                 return ContextHolder(
                     std::make_unique<Context>(make_driver(driver_config), context_config).release());
             }),
             py::arg("backend") = "freenect",
             py::arg("debug") = false,
             py::arg("log_level") = DriverLogLevel::Warning,
             py::arg("poll_interval_ms") = 10,
             "Initialises the driver and starts its event thread")
        .def("device_count", &Context::device_count, py::call_guard<py::gil_scoped_release>())
        .def("open_device",
             [](Context& ctx, int index) {
                 py::gil_scoped_release release_gil;
                 return DeviceHolder(ctx.open_device(index).release());
             },
             py::arg("index"), py::keep_alive<0, 1>(),
             "Opens device `index`")
        .def_property_readonly("internal_error_count", &Context::internal_error_count)
        .def_property_readonly("events_running", &Context::events_running)
        .def("set_internal_error_handler",
             [](Context& ctx, py::object fn) {
                 if (fn.is_none()) {
                     ctx.set_internal_error_handler(nullptr);
                     return;
                 }
                 auto callable = hold_callable(fn.cast<py::function>());
                 ctx.set_internal_error_handler([callable](const std::exception& error) {
                     py::gil_scoped_acquire acquire_gil;
                     try {
                         (*callable)(std::string(error.what()));
                     } catch (py::error_already_set& e) {
                         e.discard_as_unraisable("kinect_camera internal error handler");
                     }
                 });
             },
             py::arg("handler"),
             "Registers handler(message) for errors raised on driver threads");
}
