// cpp/gwsurrogate/surrogate/multi_mode.cpp
#include "multi_mode.hpp"
#include "../waveform/harmonics.hpp"
#include <complex>
#include <string>

namespace gwsurrogate {

void allocate_output_array(std::size_t n_samples, std::size_t num_modes,
                           std::vector<std::vector<double>>& hp,
                           std::vector<std::vector<double>>& hc) {
    hp.assign(num_modes, std::vector<double>(n_samples, 0.0));
    hc.assign(num_modes, std::vector<double>(n_samples, 0.0));
}

MultiModeSurrogate::MultiModeSurrogate(std::vector<std::pair<ModeKey, SurrogateData>> modes, int deg,
                                       const FitRegistry& fits) {
    if (modes.empty()) {
        throw ConfigurationError("no surrogate modes supplied");
    }

    for (auto& kv : modes) {
        const ModeKey& key = kv.first;
        if (key.m < 0 || key.ell < 0 || key.m > key.ell) {
            throw ConfigurationError("invalid stored mode " + key.to_string()
                                     + " (need 0 <= m <= ell)");
        }
        if (m_modes.count(key)) {
            throw ConfigurationError("duplicate mode " + key.to_string());
        }

        log_info("Surrogate", "loading surrogate mode... " + key.to_string());
        auto sur = std::make_unique<SingleModeSurrogate>(std::move(kv.second), deg, fits);

        // 所有 mode 共用时间网格
        if (m_times.empty()) {
            m_times = sur->times();
        } else if (sur->times() != m_times) {
            throw ConfigurationError("mode " + key.to_string()
                                     + " is not defined on the common time grid");
        }
        m_modes.emplace(key, std::move(sur));
    }
}

std::vector<ModeKey> MultiModeSurrogate::available_modes() const {
    std::vector<ModeKey> keys;
    keys.reserve(m_modes.size());
    for (const auto& kv : m_modes) keys.push_back(kv.first);
    return keys;
}

const SingleModeSurrogate& MultiModeSurrogate::single_mode(const ModeKey& key) const {
    auto it = m_modes.find(key);
    if (it == m_modes.end()) {
        throw ConfigurationError("mode " + key.to_string() + " not available");
    }
    return *it->second;
}

std::vector<ResolvedMode> MultiModeSurrogate::generate_mode_keys(const std::vector<ModeKey>& requested) const {
    std::vector<ResolvedMode> out;
    if (requested.empty()) {
        for (const auto& kv : m_modes) out.push_back({kv.first, kv.first});
        return out;
    }

    out.reserve(requested.size());
    for (const ModeKey& r : requested) {
        ModeKey stored{r.ell, r.m >= 0 ? r.m : -r.m};
        if (!m_modes.count(stored)) {
            throw ConfigurationError("mode " + r.to_string() + " not available");
        }
        out.push_back({r, stored});
    }
    return out;
}

WaveformResult MultiModeSurrogate::evaluate_single_mode(double q, const EvalConfig& cfg,
                                                        const ResolvedMode& mode) const {
    WaveformResult w = single_mode(mode.stored).evaluate(q, cfg);
    if (mode.requested.m < 0) {
        const double sign = (mode.stored.ell % 2 == 0) ? 1.0 : -1.0;
        for (auto& v : w.hplus) v *= sign;
        for (auto& v : w.hcross) v *= -sign;
    }
    return w;
}

void MultiModeSurrogate::evaluate_on_sphere(const ModeKey& mode,
                                            const std::optional<double>& theta,
                                            const std::optional<double>& phi,
                                            std::vector<double>& hp,
                                            std::vector<double>& hc) {
    if (!theta || !phi) return;

    const std::complex<double> Y = sYlm(-2, mode.ell, mode.m, *theta, *phi);
    for (std::size_t i = 0; i < hp.size(); ++i) {
        std::complex<double> h = Y * std::complex<double>(hp[i], hc[i]);
        hp[i] = h.real();
        hc[i] = h.imag();
    }
}

MultiModeResult MultiModeSurrogate::evaluate(double q, const MultiModeConfig& cfg) const {
    MultiModeResult res;
    res.summed = cfg.sum_modes;

    // 1. mode 解析
    const std::vector<ResolvedMode> modes = generate_mode_keys(cfg.modes);

    // 2. 预分配输出
    const std::size_t n_samples = cfg.sample_times ? cfg.sample_times->size() : m_times.size();
    allocate_output_array(n_samples, cfg.sum_modes ? 1 : modes.size(), res.hplus, res.hcross);

    const EvalConfig single_cfg = cfg.single_mode_config();

    for (std::size_t ii = 0; ii < modes.size(); ++ii) {
        const ResolvedMode& mode = modes[ii];

        // 3. 单 mode 求值 (+ 负 m 对称)
        WaveformResult w = evaluate_single_mode(q, single_cfg, mode);
        if (w.hplus.size() != n_samples) {
            throw ConfigurationError("mode " + mode.stored.to_string() + " returned "
                                     + std::to_string(w.hplus.size()) + " samples, expected "
                                     + std::to_string(n_samples));
        }
        for (auto& warn : w.warnings) {
            warn.message = mode.requested.to_string() + ": " + warn.message;
            res.warnings.push_back(std::move(warn));
        }

        // 4. 球谐投影
        evaluate_on_sphere(mode.requested, cfg.polar_angle, cfg.azimuthal_angle, w.hplus, w.hcross);

        // 5. 求和或按列存放
        if (cfg.sum_modes) {
            for (std::size_t i = 0; i < n_samples; ++i) {
                res.hplus[0][i] += w.hplus[i];
                res.hcross[0][i] += w.hcross[i];
            }
        } else {
            res.hplus[ii] = std::move(w.hplus);
            res.hcross[ii] = std::move(w.hcross);
        }
        res.modes.push_back(mode.requested);
        res.t = std::move(w.t);
    }

    return res;
}

} // namespace gwsurrogate
