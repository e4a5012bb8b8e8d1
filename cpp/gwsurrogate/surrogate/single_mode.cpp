// cpp/gwsurrogate/surrogate/single_mode.cpp
#include "single_mode.hpp"
#include "linalg.hpp"
#include "../constants.hpp"
#include "../waveform/waveform_tools.hpp"
#include <chrono>
#include <cmath>
#include <random>
#include <sstream>
#include <string>

namespace gwsurrogate {

SingleModeSurrogate::SingleModeSurrogate(SurrogateData data, int deg, const FitRegistry& fits)
    : m_data(std::move(data))
    , m_degree(deg)
{
    m_data.validate();

    // 1. 拟合函数只在这里解析一次
    m_amp_fit = fits.lookup(m_data.fit_type_amp);
    m_phase_fit = fits.lookup(m_data.fit_type_phase);
    if (m_data.has_norm_fit()) {
        m_norm_fit = fits.lookup(m_data.fit_type_norm);
    }

    // 2. basis 列样条
    switch (m_data.mode_type) {
        case SurrogateModeType::WaveformBasis:
            m_spline_1.emplace(m_data.times, real_part(m_data.B), deg);
            m_spline_2.emplace(m_data.times, imag_part(m_data.B), deg);
            break;
        case SurrogateModeType::AmpPhaseBasis:
            m_spline_1.emplace(m_data.times, m_data.B_amp, deg);
            m_spline_2.emplace(m_data.times, m_data.B_phase, deg);
            break;
    }
}

double SingleModeSurrogate::affine_mapper_checker(double x, std::vector<DomainWarning>* warnings) const {
    if (!inside_interval(x, m_data.fit_interval)) {
        std::ostringstream msg;
        msg << "Surrogate not trained at requested parameter value " << x
            << " (fit interval [" << m_data.fit_interval.first << ", "
            << m_data.fit_interval.second << "])";
        DomainWarning w{WarningKind::OutsideTrainingInterval, msg.str(), x};
        log_warning(w);
        if (warnings) warnings->push_back(w);
    }
    return affine_map(x, m_data.affine_map, m_data.fit_interval);
}

std::vector<double> SingleModeSurrogate::amp_eval(double x_0) const {
    std::vector<double> out;
    out.reserve(m_data.fitparams_amp.size());
    for (const auto& row : m_data.fitparams_amp) {
        out.push_back(m_amp_fit(row, x_0));
    }
    return out;
}

std::vector<double> SingleModeSurrogate::phase_eval(double x_0) const {
    std::vector<double> out;
    out.reserve(m_data.fitparams_phase.size());
    for (const auto& row : m_data.fitparams_phase) {
        out.push_back(m_phase_fit(row, x_0));
    }
    return out;
}

double SingleModeSurrogate::norm_eval(double x_0) const {
    if (!m_norm_fit) return 1.0;
    return m_norm_fit(m_data.fitparams_norm, x_0);
}

ComplexMatrix SingleModeSurrogate::resample_B(const std::vector<double>& samples) const {
    if (m_data.mode_type != SurrogateModeType::WaveformBasis) {
        throw ConfigurationError("resample_B requires a waveform_basis surrogate");
    }
    return resample_complex(*m_spline_1, *m_spline_2, samples);
}

std::vector<std::complex<double>> SingleModeSurrogate::h_sur(
    double x, const std::optional<std::vector<double>>& samples,
    std::vector<DomainWarning>* warnings) const
{
    if (samples && samples->empty()) {
        throw ConfigurationError("sample_times must not be empty");
    }

    // 1. 映射到标准区间
    const double x_0 = affine_mapper_checker(x, warnings);

    // 2. amp / phase / norm 拟合
    const std::vector<double> amp = amp_eval(x_0);
    const std::vector<double> phase = phase_eval(x_0);
    const double nrm = norm_eval(x_0);

    // 3. basis 重建
    std::vector<std::complex<double>> h;
    switch (m_data.mode_type) {
        case SurrogateModeType::WaveformBasis: {
            std::vector<std::complex<double>> h_eim(amp.size());
            for (std::size_t j = 0; j < amp.size(); ++j) {
                h_eim[j] = amp[j] * std::exp(std::complex<double>(0.0, phase[j]));
            }
            h = samples ? project(resample_B(*samples), h_eim) : project(m_data.B, h_eim);
            break;
        }
        case SurrogateModeType::AmpPhaseBasis: {
            std::vector<double> sur_A, sur_P;
            if (samples) {
                sur_A = project(m_spline_1->resample(*samples), amp);
                sur_P = project(m_spline_2->resample(*samples), phase);
            } else {
                sur_A = project(m_data.B_amp, amp);
                sur_P = project(m_data.B_phase, phase);
            }
            h.resize(sur_A.size());
            for (std::size_t i = 0; i < h.size(); ++i) {
                h[i] = sur_A[i] * std::exp(std::complex<double>(0.0, sur_P[i]));
            }
            break;
        }
    }

    // 4. norm
    for (auto& v : h) v *= nrm;
    return h;
}

WaveformResult SingleModeSurrogate::evaluate(double q, const EvalConfig& cfg) const {
    WaveformResult res;

    // 1. rh/M surrogate
    const double x = parameterize(q, m_data.parameterization);
    std::vector<std::complex<double>> h = h_sur(x, cfg.sample_times, &res.warnings);

    // 2. 峰值相位对齐
    if (cfg.reference_phase) {
        h = adjust_merger_phase(h, *cfg.reference_phase);
    }

    // 3. 物理单位 (需要同时给出 M 和 dist)
    double amp0 = 1.0;
    double t_scale = 1.0;
    if (cfg.total_mass && cfg.distance) {
        amp0 = ((*cfg.total_mass * mks::Msun) / (*cfg.distance * mks::Mpcinm))
             * (mks::G / (mks::c * mks::c));
        t_scale = mks::Msuninsec * *cfg.total_mass;
    }

    res.hplus.resize(h.size());
    res.hcross.resize(h.size());
    for (std::size_t i = 0; i < h.size(); ++i) {
        res.hplus[i] = amp0 * h[i].real();
        res.hcross[i] = amp0 * h[i].imag();
    }

    res.t = cfg.sample_times ? *cfg.sample_times : m_data.times;
    for (auto& ti : res.t) ti *= t_scale;

    // 4. 起始频率检查 (频率无定义时跳过)
    if (cfg.min_frequency) {
        const std::optional<double> f_start = starting_frequency(res);
        if (f_start && *f_start > *cfg.min_frequency) {
            std::ostringstream msg;
            msg << "starting frequency is " << *f_start
                << " (requested f_low = " << *cfg.min_frequency << ")";
            DomainWarning w{WarningKind::StartFrequencyAboveFloor, msg.str(), *f_start};
            log_warning(w);
            res.warnings.push_back(w);
        }
    }

    return res;
}

std::optional<double> SingleModeSurrogate::starting_frequency(const WaveformResult& r) const {
    if (r.t.size() < 2 || r.t[1] == r.t[0]) {
        return std::nullopt;
    }
    const double f = find_instant_freq(r.hplus, r.hcross, r.t);
    if (!std::isfinite(f)) return std::nullopt;
    return f;
}

std::vector<double> SingleModeSurrogate::time(TimeUnits units, double total_mass) const {
    std::vector<double> t = m_data.times;
    if (units == TimeUnits::Seconds) {
        for (auto& v : t) v *= mks::Msuninsec * total_mass;
    }
    return t;
}

std::vector<std::complex<double>> SingleModeSurrogate::basis(std::size_t i, BasisFlavor flavor) const {
    if (m_data.mode_type != SurrogateModeType::WaveformBasis) {
        throw ConfigurationError("basis() requires a waveform_basis surrogate");
    }
    if (i >= m_data.B.cols) {
        throw ConfigurationError("basis index " + std::to_string(i) + " out of range");
    }

    ComplexMatrix E;
    switch (flavor) {
        case BasisFlavor::Cardinal:
            E = m_data.B;
            break;
        case BasisFlavor::Orthogonal:
            if (m_data.V.empty()) throw ConfigurationError("orthogonal basis needs V");
            E = multiply(m_data.B, m_data.V);
            break;
        case BasisFlavor::Waveform:
            if (m_data.V.empty() || m_data.R.empty()) {
                throw ConfigurationError("waveform basis needs V and R");
            }
            E = multiply(multiply(m_data.B, m_data.V), m_data.R);
            break;
    }
    if (i >= E.cols) {
        throw ConfigurationError("basis index " + std::to_string(i) + " out of range");
    }

    std::vector<std::complex<double>> col(E.rows);
    for (std::size_t r = 0; r < E.rows; ++r) col[r] = E(r, i);
    return col;
}

TimingResult SingleModeSurrogate::timer(std::size_t n, const std::optional<EvalConfig>& cfg) const {
    std::mt19937 gen(0);
    std::uniform_real_distribution<double> dist(m_data.fit_interval.first, m_data.fit_interval.second);
    std::vector<double> ran(n);
    for (auto& v : ran) v = dist(gen);

    auto tic = std::chrono::steady_clock::now();
    for (double v : ran) {
        if (cfg) {
            evaluate(v, *cfg);
        } else {
            h_sur(v);
        }
    }
    auto toc = std::chrono::steady_clock::now();

    TimingResult r;
    r.n_evaluations = n;
    r.total_seconds = std::chrono::duration<double>(toc - tic).count();
    r.average_seconds = n ? r.total_seconds / static_cast<double>(n) : 0.0;

    log_info("Timer", "Total time to generate " + std::to_string(n) + " waveforms = "
             + std::to_string(r.total_seconds) + " s");
    log_info("Timer", "Average time to generate a single waveform = "
             + std::to_string(r.average_seconds) + " s");
    return r;
}

} // namespace gwsurrogate
