// cpp/gwsurrogate/surrogate/basis_spline.hpp
#pragma once
#include <cstddef>
#include <memory>
#include <vector>
#include <gsl/gsl_spline.h>

#include "../surrogate_params.hpp"

namespace gwsurrogate {

/// @brief 矩阵每一列一条 GSL 样条 (共享同一组节点 x)
///
/// degree = 1 -> gsl_interp_linear, degree = 3 -> gsl_interp_cspline。
/// 节点范围外使用端点所在分段的多项式外推，不会触发 GSL 的越界错误。
class ColumnSplines {
public:
    ColumnSplines(const std::vector<double>& x, const RealMatrix& columns, int degree);

    ColumnSplines(ColumnSplines&&) = default;
    ColumnSplines& operator=(ColumnSplines&&) = default;

    std::size_t size() const { return m_splines.size(); }

    /// 单点求值；acc 可以为 nullptr (二分查找)
    double eval(std::size_t col, double x, gsl_interp_accel* acc) const;

    /// 返回 samples.size() × size() 的矩阵
    RealMatrix resample(const std::vector<double>& samples) const;

private:
    struct SplineDeleter {
        void operator()(gsl_spline* s) const { gsl_spline_free(s); }
    };
    using SplinePtr = std::unique_ptr<gsl_spline, SplineDeleter>;

    double extrapolate(const gsl_spline* s, double x, double x_edge, double x_inner,
                       gsl_interp_accel* acc) const;

    std::vector<SplinePtr> m_splines;
    double m_x_first;
    double m_x_second;
    double m_x_penultimate;
    double m_x_last;
};

const gsl_interp_type* interp_type_for_degree(int degree);

/// 分别对实部和虚部建样条，再合成复矩阵
ComplexMatrix resample_complex(const ColumnSplines& re, const ColumnSplines& im,
                               const std::vector<double>& samples);

RealMatrix real_part(const ComplexMatrix& m);
RealMatrix imag_part(const ComplexMatrix& m);

} // namespace gwsurrogate
