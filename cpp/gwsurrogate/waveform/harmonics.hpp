// cpp/gwsurrogate/waveform/harmonics.hpp
#pragma once
#include <complex>

namespace gwsurrogate {

/// @brief 自旋加权球谐函数 sY_{lm}(theta, phi)
///
/// 采用 Wigner-d 展开:
///   sYlm = (-1)^s sqrt((2l+1)/4pi) d^l_{m,-s}(theta) exp(i m phi)
/// 与 LAL 约定一致，例如 -2Y22 = sqrt(5/64pi) (1+cos theta)^2 e^{2i phi}。
/// 要求 l >= |s|, |m| <= l，否则抛出 ConfigurationError。
std::complex<double> sYlm(int s, int l, int m, double theta, double phi);

} // namespace gwsurrogate
