// cpp/gwsurrogate/surrogate/basis_spline.cpp
#include "basis_spline.hpp"
#include <string>
#include <gsl/gsl_errno.h>
#include <omp.h>

namespace gwsurrogate {

namespace {

struct AccelDeleter {
    void operator()(gsl_interp_accel* a) const { gsl_interp_accel_free(a); }
};

} // namespace

const gsl_interp_type* interp_type_for_degree(int degree) {
    switch (degree) {
        case 1: return gsl_interp_linear;
        case 3: return gsl_interp_cspline;
        default:
            throw ConfigurationError("unsupported spline degree " + std::to_string(degree)
                                     + " (use 1 or 3)");
    }
}

ColumnSplines::ColumnSplines(const std::vector<double>& x, const RealMatrix& columns, int degree) {
    const gsl_interp_type* T = interp_type_for_degree(degree);
    const std::size_t n = x.size();

    if (columns.rows != n) {
        throw ConfigurationError("basis has " + std::to_string(columns.rows)
                                 + " rows but the time grid has " + std::to_string(n));
    }
    if (n < gsl_interp_type_min_size(T)) {
        throw ConfigurationError("time grid too short for a degree-" + std::to_string(degree)
                                 + " spline");
    }

    m_x_first = x[0];
    m_x_second = x[1];
    m_x_penultimate = x[n - 2];
    m_x_last = x[n - 1];

    std::vector<double> y(n);
    m_splines.reserve(columns.cols);
    for (std::size_t j = 0; j < columns.cols; ++j) {
        for (std::size_t i = 0; i < n; ++i) y[i] = columns(i, j);

        SplinePtr s(gsl_spline_alloc(T, n));
        if (!s) throw ConfigurationError("gsl_spline_alloc failed");

        // gsl_spline_init 会复制 x, y
        int status = gsl_spline_init(s.get(), x.data(), y.data(), n);
        if (status != GSL_SUCCESS) {
            throw ConfigurationError(std::string("gsl_spline_init failed: ") + gsl_strerror(status));
        }
        m_splines.push_back(std::move(s));
    }
}

// 端点分段是三次多项式 (线性样条则为一次)，用端点处的各阶导数展开
double ColumnSplines::extrapolate(const gsl_spline* s, double x, double x_edge, double x_inner,
                                  gsl_interp_accel* acc) const {
    const double v = gsl_spline_eval(s, x_edge, acc);
    const double d1 = gsl_spline_eval_deriv(s, x_edge, acc);
    const double d2 = gsl_spline_eval_deriv2(s, x_edge, acc);
    const double d2_inner = gsl_spline_eval_deriv2(s, x_inner, acc);
    const double d3 = (d2 - d2_inner) / (x_edge - x_inner);

    const double dx = x - x_edge;
    return v + dx * (d1 + dx * (0.5 * d2 + dx * d3 / 6.0));
}

double ColumnSplines::eval(std::size_t col, double x, gsl_interp_accel* acc) const {
    const gsl_spline* s = m_splines[col].get();
    if (x < m_x_first) {
        return extrapolate(s, x, m_x_first, m_x_second, acc);
    }
    if (x > m_x_last) {
        return extrapolate(s, x, m_x_last, m_x_penultimate, acc);
    }
    return gsl_spline_eval(s, x, acc);
}

RealMatrix ColumnSplines::resample(const std::vector<double>& samples) const {
    const std::size_t n_s = samples.size();
    const std::size_t n_c = m_splines.size();
    RealMatrix out(n_s, n_c);

    // 每列只由一个线程写入；accel 每线程独享
    #pragma omp parallel for schedule(static)
    for (std::size_t j = 0; j < n_c; ++j) {
        std::unique_ptr<gsl_interp_accel, AccelDeleter> acc(gsl_interp_accel_alloc());
        for (std::size_t i = 0; i < n_s; ++i) {
            out(i, j) = eval(j, samples[i], acc.get());
        }
    }
    return out;
}

ComplexMatrix resample_complex(const ColumnSplines& re, const ColumnSplines& im,
                               const std::vector<double>& samples) {
    RealMatrix r = re.resample(samples);
    RealMatrix i = im.resample(samples);
    ComplexMatrix out(r.rows, r.cols);
    for (std::size_t k = 0; k < out.data.size(); ++k) {
        out.data[k] = {r.data[k], i.data[k]};
    }
    return out;
}

RealMatrix real_part(const ComplexMatrix& m) {
    RealMatrix out(m.rows, m.cols);
    for (std::size_t k = 0; k < m.data.size(); ++k) out.data[k] = m.data[k].real();
    return out;
}

RealMatrix imag_part(const ComplexMatrix& m) {
    RealMatrix out(m.rows, m.cols);
    for (std::size_t k = 0; k < m.data.size(); ++k) out.data[k] = m.data[k].imag();
    return out;
}

} // namespace gwsurrogate
