#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "surrogate/multi_mode.hpp"

namespace py = pybind11;
using namespace gwsurrogate;

void init_bindings_multi(py::module &m) {
    py::class_<ModeKey>(m, "ModeKey")
        .def(py::init([](int ell, int mm) { return ModeKey{ell, mm}; }),
             py::arg("ell"), py::arg("m"))
        .def_readwrite("ell", &ModeKey::ell)
        .def_readwrite("m", &ModeKey::m)
        .def("__repr__", &ModeKey::to_string);

    py::class_<MultiModeConfig>(m, "MultiModeConfig")
        .def(py::init<>())
        .def_readwrite("total_mass", &MultiModeConfig::total_mass)
        .def_readwrite("distance", &MultiModeConfig::distance)
        .def_readwrite("polar_angle", &MultiModeConfig::polar_angle)
        .def_readwrite("azimuthal_angle", &MultiModeConfig::azimuthal_angle)
        .def_readwrite("reference_phase", &MultiModeConfig::reference_phase)
        .def_readwrite("min_frequency", &MultiModeConfig::min_frequency)
        .def_readwrite("sample_times", &MultiModeConfig::sample_times)
        .def_readwrite("modes", &MultiModeConfig::modes)
        .def_readwrite("sum_modes", &MultiModeConfig::sum_modes);

    // 求和时返回一维数组，按列堆叠时返回每个 mode 一列
    py::class_<MultiModeResult>(m, "MultiModeResult")
        .def_readonly("t", &MultiModeResult::t)
        .def_property_readonly("hplus", [](const MultiModeResult &r) -> py::object {
            if (r.summed) return py::cast(r.hplus.front());
            return py::cast(r.hplus);
        })
        .def_property_readonly("hcross", [](const MultiModeResult &r) -> py::object {
            if (r.summed) return py::cast(r.hcross.front());
            return py::cast(r.hcross);
        })
        .def_readonly("modes", &MultiModeResult::modes)
        .def_readonly("warnings", &MultiModeResult::warnings)
        .def_readonly("summed", &MultiModeResult::summed);

    py::class_<MultiModeSurrogate>(m, "MultiModeSurrogate")
        .def(py::init([](std::vector<std::pair<ModeKey, SurrogateData>> modes, int deg) {
                 return std::make_unique<MultiModeSurrogate>(std::move(modes), deg);
             }),
             py::arg("modes"), py::arg("deg") = 3)
        .def("evaluate", &MultiModeSurrogate::evaluate,
             py::arg("q"), py::arg("config") = MultiModeConfig(),
             "Evaluate requested modes, summed or stacked per mode")
        .def("available_modes", &MultiModeSurrogate::available_modes)
        .def("single_mode", &MultiModeSurrogate::single_mode,
             py::arg("key"), py::return_value_policy::reference_internal)
        .def("times", &MultiModeSurrogate::times);
}
