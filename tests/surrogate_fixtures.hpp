// tests/surrogate_fixtures.hpp
#pragma once

#include <cmath>
#include <complex>
#include <vector>

#include "surrogate_params.hpp"

namespace gwsurrogate {
namespace testing_data {

// 均匀时间网格 [t0, t1]
inline std::vector<double> linspace(double t0, double t1, std::size_t n) {
    std::vector<double> t(n);
    for (std::size_t i = 0; i < n; ++i) {
        t[i] = t0 + (t1 - t0) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return t;
}

constexpr double kCarrier = 0.1;   // 载波角频率 (1/M)
constexpr double kWidth = 30.0;    // 包络宽度 (M)

/// 三列复 basis: 高斯包络 * exp(-i w t)，中心在 -20, 0, 20
/// 拟合: amp = polyval(x) 的线性函数，phase 为小的线性函数
inline SurrogateData make_waveform_basis_data(double amp_scale = 1.0, std::size_t n_t = 251) {
    SurrogateData d;
    d.times = linspace(-200.0, 50.0, n_t);
    d.affine_map = AffineMap::ZeroToOne;
    d.fit_interval = {0.1, 0.9};
    d.mode_type = SurrogateModeType::WaveformBasis;
    d.parameterization = Parameterization::MassRatio;

    const double centers[3] = {-20.0, 0.0, 20.0};
    d.B = ComplexMatrix(n_t, 3);
    for (std::size_t i = 0; i < n_t; ++i) {
        const double t = d.times[i];
        for (std::size_t j = 0; j < 3; ++j) {
            const double g = std::exp(-(t - centers[j]) * (t - centers[j]) / (2.0 * kWidth * kWidth));
            d.B(i, j) = g * std::exp(std::complex<double>(0.0, -kCarrier * t));
        }
    }

    d.fit_type_amp = "polyval_1d";
    d.fit_type_phase = "polyval_1d";
    d.fitparams_amp = {{0.5 * amp_scale, 1.0 * amp_scale},
                       {0.2 * amp_scale, 0.8 * amp_scale},
                       {-0.1 * amp_scale, 0.4 * amp_scale}};
    d.fitparams_phase = {{0.05, 0.0}, {0.02, 0.01}, {-0.03, 0.02}};

    // 对角 V, R 只用于 basis() 诊断
    d.V = ComplexMatrix(3, 3);
    d.R = ComplexMatrix(3, 3);
    for (std::size_t j = 0; j < 3; ++j) {
        d.V(j, j) = 2.0;
        d.R(j, j) = {0.0, 1.0};
    }
    return d;
}

/// 实 basis: A(t) = c0 * 包络 + c1，P(t) = c2 * t
inline SurrogateData make_amp_phase_data(std::size_t n_t = 201) {
    SurrogateData d;
    d.times = linspace(-100.0, 50.0, n_t);
    d.affine_map = AffineMap::MinusOneToOne;
    d.fit_interval = {1.0, 10.0};
    d.mode_type = SurrogateModeType::AmpPhaseBasis;
    d.parameterization = Parameterization::MassRatio;

    d.B_amp = RealMatrix(n_t, 2);
    d.B_phase = RealMatrix(n_t, 1);
    for (std::size_t i = 0; i < n_t; ++i) {
        const double t = d.times[i];
        d.B_amp(i, 0) = std::exp(-t * t / (2.0 * kWidth * kWidth));
        d.B_amp(i, 1) = 1.0;
        d.B_phase(i, 0) = t;
    }

    d.fit_type_amp = "polyval_1d";
    d.fit_type_phase = "constant";
    d.fitparams_amp = {{0.5, 2.0}, {0.0, 0.1}};
    d.fitparams_phase = {{-kCarrier}};
    return d;
}

} // namespace testing_data
} // namespace gwsurrogate
