#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/stl.h>
#include "surrogate_params.hpp"
#include "fits/fit_registry.hpp"
#include "surrogate/single_mode.hpp"
#include "waveform/harmonics.hpp"
#include "waveform/waveform_tools.hpp"

namespace py = pybind11;
using namespace gwsurrogate;

void init_bindings_single(py::module &m) {
    // --- 错误类型 ---
    py::register_exception<ConfigurationError>(m, "ConfigurationError");

    // --- 枚举 ---
    py::enum_<AffineMap>(m, "AffineMap")
        .value("none", AffineMap::None)
        .value("zero_to_1", AffineMap::ZeroToOne)
        .value("minus1_to_1", AffineMap::MinusOneToOne);

    py::enum_<SurrogateModeType>(m, "SurrogateModeType")
        .value("waveform_basis", SurrogateModeType::WaveformBasis)
        .value("amp_phase_basis", SurrogateModeType::AmpPhaseBasis);

    py::enum_<Parameterization>(m, "Parameterization")
        .value("q", Parameterization::MassRatio)
        .value("eta", Parameterization::SymmetricMassRatio)
        .value("log_q", Parameterization::LogMassRatio);

    py::enum_<WarningKind>(m, "WarningKind")
        .value("outside_training_interval", WarningKind::OutsideTrainingInterval)
        .value("start_frequency_above_floor", WarningKind::StartFrequencyAboveFloor);

    py::enum_<TimeUnits>(m, "TimeUnits")
        .value("geometric", TimeUnits::Geometric)
        .value("seconds", TimeUnits::Seconds);

    py::enum_<BasisFlavor>(m, "BasisFlavor")
        .value("cardinal", BasisFlavor::Cardinal)
        .value("orthogonal", BasisFlavor::Orthogonal)
        .value("waveform", BasisFlavor::Waveform);

    m.def("parse_affine_map", &parse_affine_map, py::arg("tag"));
    m.def("parse_surrogate_mode_type", &parse_surrogate_mode_type, py::arg("tag"));
    m.def("parse_parameterization", &parse_parameterization, py::arg("tag"));
    m.def("set_log_enabled", &set_log_enabled, py::arg("enabled"));

    // --- 数据 ---
    py::class_<RealMatrix>(m, "RealMatrix")
        .def(py::init<>())
        .def(py::init<std::size_t, std::size_t>(), py::arg("rows"), py::arg("cols"))
        .def_readwrite("rows", &RealMatrix::rows)
        .def_readwrite("cols", &RealMatrix::cols)
        .def_readwrite("data", &RealMatrix::data);

    py::class_<ComplexMatrix>(m, "ComplexMatrix")
        .def(py::init<>())
        .def(py::init<std::size_t, std::size_t>(), py::arg("rows"), py::arg("cols"))
        .def_readwrite("rows", &ComplexMatrix::rows)
        .def_readwrite("cols", &ComplexMatrix::cols)
        .def_readwrite("data", &ComplexMatrix::data);

    py::class_<SurrogateData>(m, "SurrogateData")
        .def(py::init<>())
        .def_readwrite("times", &SurrogateData::times)
        .def_readwrite("affine_map", &SurrogateData::affine_map)
        .def_readwrite("fit_interval", &SurrogateData::fit_interval)
        .def_readwrite("mode_type", &SurrogateData::mode_type)
        .def_readwrite("parameterization", &SurrogateData::parameterization)
        .def_readwrite("fit_type_amp", &SurrogateData::fit_type_amp)
        .def_readwrite("fit_type_phase", &SurrogateData::fit_type_phase)
        .def_readwrite("fitparams_amp", &SurrogateData::fitparams_amp)
        .def_readwrite("fitparams_phase", &SurrogateData::fitparams_phase)
        .def_readwrite("B", &SurrogateData::B)
        .def_readwrite("V", &SurrogateData::V)
        .def_readwrite("R", &SurrogateData::R)
        .def_readwrite("B_amp", &SurrogateData::B_amp)
        .def_readwrite("B_phase", &SurrogateData::B_phase)
        .def_readwrite("fit_type_norm", &SurrogateData::fit_type_norm)
        .def_readwrite("fitparams_norm", &SurrogateData::fitparams_norm)
        .def("validate", &SurrogateData::validate);

    py::class_<FieldComparison>(m, "FieldComparison")
        .def_readonly("field", &FieldComparison::field)
        .def_readonly("agrees", &FieldComparison::agrees);
    m.def("compare_surrogate_data", &compare_surrogate_data, py::arg("a"), py::arg("b"));

    // --- 配置与结果 ---
    py::class_<EvalConfig>(m, "EvalConfig")
        .def(py::init<>())
        .def_readwrite("total_mass", &EvalConfig::total_mass)
        .def_readwrite("distance", &EvalConfig::distance)
        .def_readwrite("reference_phase", &EvalConfig::reference_phase)
        .def_readwrite("min_frequency", &EvalConfig::min_frequency)
        .def_readwrite("sample_times", &EvalConfig::sample_times);

    py::class_<DomainWarning>(m, "DomainWarning")
        .def_readonly("kind", &DomainWarning::kind)
        .def_readonly("message", &DomainWarning::message)
        .def_readonly("value", &DomainWarning::value)
        .def("__repr__", [](const DomainWarning &w) {
            return "<DomainWarning " + w.message + ">";
        });

    py::class_<WaveformResult>(m, "WaveformResult")
        .def_readonly("t", &WaveformResult::t)
        .def_readonly("hplus", &WaveformResult::hplus)
        .def_readonly("hcross", &WaveformResult::hcross)
        .def_readonly("warnings", &WaveformResult::warnings);

    py::class_<TimingResult>(m, "TimingResult")
        .def_readonly("n_evaluations", &TimingResult::n_evaluations)
        .def_readonly("total_seconds", &TimingResult::total_seconds)
        .def_readonly("average_seconds", &TimingResult::average_seconds);

    // --- 单 mode 求值器 ---
    // 拟合函数只使用内置目录
    py::class_<SingleModeSurrogate>(m, "SingleModeSurrogate")
        .def(py::init([](SurrogateData data, int deg) {
                 return SingleModeSurrogate(std::move(data), deg);
             }),
             py::arg("data"), py::arg("deg") = 3)
        .def("evaluate", &SingleModeSurrogate::evaluate,
             py::arg("q"), py::arg("config") = EvalConfig(),
             "Evaluate the mode at mass ratio q, returns (t, hp, hc) and warnings")
        .def("h_sur", [](const SingleModeSurrogate &s, double x,
                         const std::optional<std::vector<double>> &samples) {
                 return s.h_sur(x, samples);
             },
             py::arg("x"), py::arg("samples") = py::none())
        .def("starting_frequency", &SingleModeSurrogate::starting_frequency, py::arg("result"),
             "Instantaneous frequency at the first sample, None if undefined")
        .def("amp_eval", &SingleModeSurrogate::amp_eval, py::arg("x_0"))
        .def("phase_eval", &SingleModeSurrogate::phase_eval, py::arg("x_0"))
        .def("norm_eval", &SingleModeSurrogate::norm_eval, py::arg("x_0"))
        .def("time", &SingleModeSurrogate::time,
             py::arg("units") = TimeUnits::Geometric, py::arg("total_mass") = 1.0)
        .def("basis", &SingleModeSurrogate::basis,
             py::arg("i"), py::arg("flavor") = BasisFlavor::Waveform)
        .def("timer", &SingleModeSurrogate::timer,
             py::arg("n") = 1000, py::arg("config") = py::none());

    // --- 波形工具 ---
    m.def("sYlm", &sYlm, py::arg("s"), py::arg("l"), py::arg("m"), py::arg("theta"), py::arg("phi"));
    m.def("find_instant_freq", &find_instant_freq, py::arg("hp"), py::arg("hc"), py::arg("t"));
    m.def("phi_merger", &phi_merger, py::arg("h"));
    m.def("adjust_merger_phase", &adjust_merger_phase, py::arg("h"), py::arg("phi_ref"));
    m.def("write_waveform", &write_waveform,
          py::arg("t"), py::arg("hp"), py::arg("hc"),
          py::arg("filename") = "output", py::arg("ext") = "bin");
}
