// cpp/gwsurrogate/waveform/harmonics.cpp
#include "harmonics.hpp"
#include "../surrogate_params.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <gsl/gsl_sf_gamma.h>

namespace gwsurrogate {

namespace {

// Wigner d^l_{m,s}(theta)，对 k 求和
double wigner_d(int l, int m, int s, double theta) {
    const double c = std::cos(0.5 * theta);
    const double sn = std::sin(0.5 * theta);

    const int k_min = std::max(0, m - s);
    const int k_max = std::min(l + m, l - s);

    const double norm = std::sqrt(gsl_sf_fact(l + m) * gsl_sf_fact(l - m)
                                  * gsl_sf_fact(l + s) * gsl_sf_fact(l - s));
    double sum = 0.0;
    for (int k = k_min; k <= k_max; ++k) {
        double denom = gsl_sf_fact(l + m - k) * gsl_sf_fact(l - s - k)
                     * gsl_sf_fact(k) * gsl_sf_fact(k + s - m);
        double sign = (k % 2 == 0) ? 1.0 : -1.0;
        sum += sign * norm / denom
             * std::pow(c, 2 * l + m - s - 2 * k)
             * std::pow(sn, 2 * k + s - m);
    }
    return sum;
}

} // namespace

std::complex<double> sYlm(int s, int l, int m, double theta, double phi) {
    if (l < std::abs(s) || std::abs(m) > l) {
        throw ConfigurationError("invalid spin-weighted harmonic (s=" + std::to_string(s)
                                 + ", l=" + std::to_string(l) + ", m=" + std::to_string(m) + ")");
    }
    const double sign = (s % 2 == 0) ? 1.0 : -1.0;
    const double fac = sign * std::sqrt((2.0 * l + 1.0) / (4.0 * M_PI)) * wigner_d(l, m, -s, theta);
    return fac * std::complex<double>(std::cos(m * phi), std::sin(m * phi));
}

} // namespace gwsurrogate
