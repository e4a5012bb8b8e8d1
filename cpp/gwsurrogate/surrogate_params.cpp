// cpp/gwsurrogate/surrogate_params.cpp
#include "surrogate_params.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>

namespace gwsurrogate {

namespace {

// 可被多个线程同时读写
std::atomic<bool> g_log_enabled{true};

void check_fit_table(const FitTable& table, std::size_t n_basis, const char* name) {
    if (table.size() != n_basis) {
        throw ConfigurationError(std::string(name) + " has " + std::to_string(table.size())
                                 + " rows, basis has " + std::to_string(n_basis) + " columns");
    }
    for (const auto& row : table) {
        if (row.empty() || row.size() != table.front().size()) {
            throw ConfigurationError(std::string(name) + " rows must be non-empty and of equal length");
        }
    }
}

template <typename T>
void check_storage(const Matrix<T>& mat, const char* name) {
    if (mat.data.size() != mat.rows * mat.cols) {
        throw ConfigurationError(std::string(name) + " storage does not match its shape");
    }
}

// 数组字段：形状一致且最大差为 0 才算一致
template <typename T>
bool same_matrix(const Matrix<T>& a, const Matrix<T>& b) {
    if (a.rows != b.rows || a.cols != b.cols) return false;
    double max_diff = 0.0;
    for (std::size_t k = 0; k < a.data.size(); ++k) {
        max_diff = std::max(max_diff, std::abs(a.data[k] - b.data[k]));
    }
    return max_diff == 0.0;
}

bool same_table(const FitTable& a, const FitTable& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

} // namespace

void set_log_enabled(bool enabled) { g_log_enabled.store(enabled); }

bool log_enabled() { return g_log_enabled.load(); }

void log_warning(const DomainWarning& w) {
    if (!g_log_enabled.load()) return;
    std::cerr << "[C++ Warning] " << w.message << std::endl;
}

void log_info(const std::string& tag, const std::string& msg) {
    if (!g_log_enabled.load()) return;
    std::cout << "[C++ " << tag << "] " << msg << std::endl;
}

AffineMap parse_affine_map(const std::string& tag) {
    if (tag == "none") return AffineMap::None;
    if (tag == "zero_to_1") return AffineMap::ZeroToOne;
    if (tag == "minus1_to_1") return AffineMap::MinusOneToOne;
    throw ConfigurationError("unknown affine map '" + tag + "'");
}

SurrogateModeType parse_surrogate_mode_type(const std::string& tag) {
    if (tag == "waveform_basis") return SurrogateModeType::WaveformBasis;
    if (tag == "amp_phase_basis") return SurrogateModeType::AmpPhaseBasis;
    throw ConfigurationError("invalid surrogate type '" + tag + "'");
}

Parameterization parse_parameterization(const std::string& tag) {
    if (tag == "q") return Parameterization::MassRatio;
    if (tag == "eta") return Parameterization::SymmetricMassRatio;
    if (tag == "log_q") return Parameterization::LogMassRatio;
    throw ConfigurationError("unknown parameterization '" + tag + "'");
}

SurrogateData::SurrogateData()
    : affine_map(AffineMap::None)
    , fit_interval(0.0, 1.0)
    , mode_type(SurrogateModeType::WaveformBasis)
    , parameterization(Parameterization::MassRatio)
{
}

void SurrogateData::validate() const {
    const std::size_t n_t = times.size();
    if (n_t < 2) {
        throw ConfigurationError("time grid needs at least 2 samples");
    }
    for (std::size_t i = 1; i < n_t; ++i) {
        if (!(times[i] > times[i - 1])) {
            throw ConfigurationError("time grid must be strictly increasing (index "
                                     + std::to_string(i) + ")");
        }
    }
    if (!(fit_interval.first < fit_interval.second)) {
        throw ConfigurationError("degenerate fit interval");
    }
    if (fit_type_amp.empty() || fit_type_phase.empty()) {
        throw ConfigurationError("missing amplitude or phase fit type");
    }
    if (has_norm_fit() && fitparams_norm.empty()) {
        throw ConfigurationError("norm fit '" + fit_type_norm + "' has no coefficients");
    }

    if (mode_type == SurrogateModeType::WaveformBasis) {
        check_storage(B, "B");
        if (B.empty() || B.rows != n_t) {
            throw ConfigurationError("B must have one row per time sample");
        }
        check_fit_table(fitparams_amp, B.cols, "fitparams_amp");
        check_fit_table(fitparams_phase, B.cols, "fitparams_phase");
        if (!V.empty()) {
            check_storage(V, "V");
            if (V.rows != B.cols) throw ConfigurationError("V rows must equal B columns");
        }
        if (!R.empty()) {
            check_storage(R, "R");
            if (V.empty() || R.rows != V.cols) throw ConfigurationError("R rows must equal V columns");
        }
    } else {
        check_storage(B_amp, "B_amp");
        check_storage(B_phase, "B_phase");
        if (B_amp.empty() || B_amp.rows != n_t || B_phase.empty() || B_phase.rows != n_t) {
            throw ConfigurationError("B_amp and B_phase must have one row per time sample");
        }
        check_fit_table(fitparams_amp, B_amp.cols, "fitparams_amp");
        check_fit_table(fitparams_phase, B_phase.cols, "fitparams_phase");
    }
}

std::vector<FieldComparison> compare_surrogate_data(const SurrogateData& a,
                                                    const SurrogateData& b) {
    std::vector<FieldComparison> out;
    out.push_back({"B", same_matrix(a.B, b.B)});
    out.push_back({"V", same_matrix(a.V, b.V)});
    out.push_back({"R", same_matrix(a.R, b.R)});
    out.push_back({"B_amp", same_matrix(a.B_amp, b.B_amp)});
    out.push_back({"B_phase", same_matrix(a.B_phase, b.B_phase)});
    out.push_back({"fitparams_amp", same_table(a.fitparams_amp, b.fitparams_amp)});
    out.push_back({"fitparams_phase", same_table(a.fitparams_phase, b.fitparams_phase)});
    out.push_back({"fitparams_norm", a.fitparams_norm == b.fitparams_norm});
    out.push_back({"fit_type_amp", a.fit_type_amp == b.fit_type_amp});
    out.push_back({"fit_type_phase", a.fit_type_phase == b.fit_type_phase});
    out.push_back({"fit_type_norm", a.fit_type_norm == b.fit_type_norm});

    for (const auto& c : out) {
        log_info("Compare", "checking attribute " + c.field + "..."
                 + (c.agrees ? "agrees" : "DIFFERENT!!!"));
    }
    return out;
}

EvalConfig::EvalConfig() = default;

std::string ModeKey::to_string() const {
    return "l" + std::to_string(ell) + "_m" + std::to_string(m);
}

MultiModeConfig::MultiModeConfig()
    : sum_modes(true)
{
}

EvalConfig MultiModeConfig::single_mode_config() const {
    EvalConfig c;
    c.total_mass = total_mass;
    c.distance = distance;
    c.reference_phase = reference_phase;
    c.min_frequency = min_frequency;
    c.sample_times = sample_times;
    return c;
}

} // namespace gwsurrogate
