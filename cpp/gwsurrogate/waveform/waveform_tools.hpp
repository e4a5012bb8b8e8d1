// cpp/gwsurrogate/waveform/waveform_tools.hpp
#pragma once

#include <complex>
#include <string>
#include <utility>
#include <vector>

#include "../surrogate_params.hpp"

namespace gwsurrogate {

using ComplexSeries = std::vector<std::complex<double>>;

// --- 参数映射 ---

/// q -> 拟合参数 x (q, eta 或 ln q)；eta / ln q 要求 q > 0
double parameterize(double q, Parameterization p);

/// 把 x 映射到模型的标准区间: none / [0,1] / [-1,1]
double affine_map(double x, AffineMap map, const std::pair<double, double>& interval);

bool inside_interval(double x, const std::pair<double, double>& interval);

// --- 振幅 / 相位 ---

/// h = A exp(i phi)，phi 已做 unwrap
void amp_phase(const ComplexSeries& h, std::vector<double>& amp, std::vector<double>& phase);

/// 离散振幅峰值处的相位
double phi_merger(const ComplexSeries& h);

/// h -> h exp(i dphi)
ComplexSeries modify_phase(const ComplexSeries& h, double dphi);

/// 旋转常数相位，使峰值处 phase(t_peak) = phi_ref
ComplexSeries adjust_merger_phase(const ComplexSeries& h, double phi_ref);

/// 起始时刻的瞬时频率 |dphi/dt| / 2pi，假设 A 与 f 缓变
double find_instant_freq(const std::vector<double>& hp,
                         const std::vector<double>& hc,
                         const std::vector<double>& t);

ComplexSeries to_complex(const std::vector<double>& hp, const std::vector<double>& hc);

// --- 输出 ---

/// ext = "txt": 三行文本 (t, hp, hc)
/// ext = "bin": uint64 长度 + 3 段 IEEE-754 double，全部小端字节序
void write_waveform(const std::vector<double>& t,
                    const std::vector<double>& hp,
                    const std::vector<double>& hc,
                    const std::string& filename = "output",
                    const std::string& ext = "bin");

} // namespace gwsurrogate
