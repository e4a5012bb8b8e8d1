// cpp/gwsurrogate/surrogate/single_mode.hpp
#pragma once

#include <complex>
#include <cstddef>
#include <optional>
#include <vector>

#include "../surrogate_params.hpp"
#include "../fits/fit_registry.hpp"
#include "basis_spline.hpp"

namespace gwsurrogate {

enum class TimeUnits {
    Geometric, ///< t/M (G = c = 1)
    Seconds    ///< 乘以 M * Msun_in_sec
};

enum class BasisFlavor {
    Cardinal,   ///< B 的第 i 列
    Orthogonal, ///< (B V) 的第 i 列
    Waveform    ///< (B V R) 的第 i 列
};

struct TimingResult {
    std::size_t n_evaluations;
    double total_seconds;
    double average_seconds;
};

/// @brief 单个 (ell, m) mode 的 surrogate 求值器
///
/// 构造时:
///  - 校验 SurrogateData 的形状不变量
///  - 按名字解析拟合函数 (amp / phase / norm)
///  - 为 basis 的每一列建立样条 (复 basis 的实部、虚部分开)
/// 之后对象只读，evaluate() 可以并发调用。
class SingleModeSurrogate {
public:
    explicit SingleModeSurrogate(SurrogateData data, int deg = 3,
                                 const FitRegistry& fits = FitRegistry::builtin());

    SingleModeSurrogate(SingleModeSurrogate&&) = default;

    /// 在质量比 q 处求值，返回 (t, h+, h×)
    ///
    /// 顺序: 参数映射 -> 拟合求值 -> basis 重建 -> 相位对齐 -> 物理单位 -> 频率检查
    WaveformResult evaluate(double q, const EvalConfig& cfg = EvalConfig()) const;

    /// 裸 surrogate: 在已参数化的 x 处返回 rh/M (t/M 网格或 samples)
    std::vector<std::complex<double>> h_sur(double x,
                                            const std::optional<std::vector<double>>& samples = std::nullopt,
                                            std::vector<DomainWarning>* warnings = nullptr) const;

    /// x -> x_0，并检查 x 是否在训练区间内
    double affine_mapper_checker(double x, std::vector<DomainWarning>* warnings = nullptr) const;

    /// 结果首个采样点处的瞬时频率；少于 2 个采样点或前两个时刻相同时无定义
    std::optional<double> starting_frequency(const WaveformResult& r) const;

    std::vector<double> amp_eval(double x_0) const;
    std::vector<double> phase_eval(double x_0) const;
    double norm_eval(double x_0) const;

    /// 在 samples 处重采样复 basis B (仅 waveform_basis)
    ComplexMatrix resample_B(const std::vector<double>& samples) const;

    std::vector<double> time(TimeUnits units = TimeUnits::Geometric, double total_mass = 1.0) const;

    std::vector<std::complex<double>> basis(std::size_t i, BasisFlavor flavor = BasisFlavor::Waveform) const;

    /// 在 fit_interval 内随机取 n 个参数求值并计时；cfg 为空时只计 h_sur
    TimingResult timer(std::size_t n = 1000,
                       const std::optional<EvalConfig>& cfg = std::nullopt) const;

    const SurrogateData& data() const { return m_data; }
    const std::vector<double>& times() const { return m_data.times; }
    int degree() const { return m_degree; }

private:
    SurrogateData m_data;
    int m_degree;

    FitFunction m_amp_fit;
    FitFunction m_phase_fit;
    FitFunction m_norm_fit; // 空 => norm = 1

    // waveform_basis: 实部 / 虚部；amp_phase_basis: B_amp / B_phase
    std::optional<ColumnSplines> m_spline_1;
    std::optional<ColumnSplines> m_spline_2;
};

} // namespace gwsurrogate
