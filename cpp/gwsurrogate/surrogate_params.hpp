// cpp/gwsurrogate/surrogate_params.hpp
#pragma once
#include <complex>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gwsurrogate {

// =======================================================
// 1. 错误与警告
// =======================================================

/// @brief 模型或调用约定损坏时抛出 (未知 tag、形状不匹配、缺失 mode 等)
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

enum class WarningKind {
    OutsideTrainingInterval,   ///< 参数在训练区间之外 (外推)
    StartFrequencyAboveFloor   ///< 起始瞬时频率高于 f_low
};

/// 非致命警告：求值照常完成，警告随结果一起返回
struct DomainWarning {
    WarningKind kind;
    std::string message;
    double value;
};

// 控制台输出开关 (默认打开)。关闭后警告仍然写入结果。
void set_log_enabled(bool enabled);
bool log_enabled();
void log_warning(const DomainWarning& w);
void log_info(const std::string& tag, const std::string& msg);

// =======================================================
// 2. 存储层使用的字符串 tag
// =======================================================
enum class AffineMap {
    None,           ///< "none"
    ZeroToOne,      ///< "zero_to_1"
    MinusOneToOne   ///< "minus1_to_1"
};

enum class SurrogateModeType {
    WaveformBasis,  ///< "waveform_basis": 复 basis B
    AmpPhaseBasis   ///< "amp_phase_basis": 实 basis B_amp, B_phase
};

/// 质量比 q 到拟合参数 x 的变换
enum class Parameterization {
    MassRatio,          ///< "q"
    SymmetricMassRatio, ///< "eta" = q/(1+q)^2
    LogMassRatio        ///< "log_q"
};

AffineMap parse_affine_map(const std::string& tag);
SurrogateModeType parse_surrogate_mode_type(const std::string& tag);
Parameterization parse_parameterization(const std::string& tag);

// =======================================================
// 3. 数据容器
// =======================================================

/// 行优先 (row-major) 稠密矩阵，直接交给 gsl_matrix_*_view_array
template <typename T>
struct Matrix {
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::vector<T> data;

    Matrix() = default;
    Matrix(std::size_t r, std::size_t c) : rows(r), cols(c), data(r * c, T()) {}

    T& operator()(std::size_t i, std::size_t j) { return data[i * cols + j]; }
    const T& operator()(std::size_t i, std::size_t j) const { return data[i * cols + j]; }
    bool empty() const { return data.empty(); }
};

using RealMatrix = Matrix<double>;
using ComplexMatrix = Matrix<std::complex<double>>;

/// 拟合系数表：每行对应一个 basis 自由度
using FitTable = std::vector<std::vector<double>>;

/// @brief 单个 mode 的 surrogate 数据 (由 I/O 层构造，之后只读)
///
/// waveform_basis 使用 B (n_t × n_rb)；amp_phase_basis 使用 B_amp / B_phase。
/// V, R 只在诊断用的 basis() 中使用。
struct SurrogateData {
    std::vector<double> times;
    AffineMap affine_map;
    std::pair<double, double> fit_interval;
    SurrogateModeType mode_type;
    Parameterization parameterization;

    std::string fit_type_amp;
    std::string fit_type_phase;
    FitTable fitparams_amp;
    FitTable fitparams_phase;

    ComplexMatrix B;
    ComplexMatrix V;
    ComplexMatrix R;

    RealMatrix B_amp;
    RealMatrix B_phase;

    // fit_type_norm 为空 => norm 恒为 1
    std::string fit_type_norm;
    std::vector<double> fitparams_norm;

    SurrogateData();

    bool has_norm_fit() const { return !fit_type_norm.empty(); }

    /// 检查所有形状不变量，失败时抛出 ConfigurationError
    void validate() const;
};

/// 逐字段比较两个 surrogate (B, V, R, 拟合表, 拟合类型名)
struct FieldComparison {
    std::string field;
    bool agrees;
};

std::vector<FieldComparison> compare_surrogate_data(const SurrogateData& a,
                                                    const SurrogateData& b);

// =======================================================
// 4. 求值配置与结果
// =======================================================

/// 单 mode 求值参数，全部可选
struct EvalConfig {
    std::optional<double> total_mass;      ///< 总质量 (太阳质量)
    std::optional<double> distance;        ///< 距离 (Mpc)
    std::optional<double> reference_phase; ///< 振幅峰值处的相位
    std::optional<double> min_frequency;   ///< 起始频率下限 f_low
    std::optional<std::vector<double>> sample_times; ///< 自定义采样时间 (t/M)

    EvalConfig();
};

/// (ell, m) 模式标识；存储约定 m >= 0
struct ModeKey {
    int ell;
    int m;

    std::string to_string() const;
    bool operator<(const ModeKey& o) const {
        return ell < o.ell || (ell == o.ell && m < o.m);
    }
    bool operator==(const ModeKey& o) const { return ell == o.ell && m == o.m; }
};

struct MultiModeConfig {
    std::optional<double> total_mass;
    std::optional<double> distance;
    std::optional<double> polar_angle;     ///< theta
    std::optional<double> azimuthal_angle; ///< phi
    std::optional<double> reference_phase;
    std::optional<double> min_frequency;
    std::optional<std::vector<double>> sample_times;
    std::vector<ModeKey> modes;            ///< 为空 => 全部已加载的 mode
    bool sum_modes;

    MultiModeConfig();

    EvalConfig single_mode_config() const;
};

struct WaveformResult {
    std::vector<double> t;
    std::vector<double> hplus;
    std::vector<double> hcross;
    std::vector<DomainWarning> warnings;
};

/// sum_modes 时 hplus / hcross 只有一列；否则每个请求的 mode 一列
struct MultiModeResult {
    std::vector<double> t;
    std::vector<std::vector<double>> hplus;
    std::vector<std::vector<double>> hcross;
    std::vector<ModeKey> modes;
    std::vector<DomainWarning> warnings;
    bool summed = false; ///< true => hplus[0] / hcross[0] 是各 mode 之和
};

} // namespace gwsurrogate
