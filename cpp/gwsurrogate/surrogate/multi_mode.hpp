// cpp/gwsurrogate/surrogate/multi_mode.hpp
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../surrogate_params.hpp"
#include "single_mode.hpp"

namespace gwsurrogate {

/// 请求的 mode 与实际存储的 mode (m >= 0)
struct ResolvedMode {
    ModeKey requested;
    ModeKey stored;
};

/// @brief 多 mode surrogate：逐 mode 求值，球谐投影后求和或按列堆叠
///
/// 所有 mode 必须共用同一时间网格，构造时检查，不一致直接抛出 ConfigurationError。
class MultiModeSurrogate {
public:
    MultiModeSurrogate(std::vector<std::pair<ModeKey, SurrogateData>> modes, int deg = 3,
                       const FitRegistry& fits = FitRegistry::builtin());

    MultiModeResult evaluate(double q, const MultiModeConfig& cfg = MultiModeConfig()) const;

    /// requested 为空 => 所有已加载的 mode；m < 0 映射到 (ell, -m)
    std::vector<ResolvedMode> generate_mode_keys(const std::vector<ModeKey>& requested) const;

    /// 单 mode 求值，并对 m < 0 应用 h(l,-m) = (-1)^l h(l,m)^*
    WaveformResult evaluate_single_mode(double q, const EvalConfig& cfg, const ResolvedMode& mode) const;

    /// theta, phi 都给出时乘以 -2Ylm；否则原样返回
    static void evaluate_on_sphere(const ModeKey& mode,
                                   const std::optional<double>& theta,
                                   const std::optional<double>& phi,
                                   std::vector<double>& hp,
                                   std::vector<double>& hc);

    std::vector<ModeKey> available_modes() const;
    const SingleModeSurrogate& single_mode(const ModeKey& key) const;
    const std::vector<double>& times() const { return m_times; }

private:
    std::map<ModeKey, std::unique_ptr<SingleModeSurrogate>> m_modes;
    std::vector<double> m_times;
};

/// 预先分配输出: num_modes 列，每列 n_samples 个 0
void allocate_output_array(std::size_t n_samples, std::size_t num_modes,
                           std::vector<std::vector<double>>& hp,
                           std::vector<std::vector<double>>& hc);

} // namespace gwsurrogate
