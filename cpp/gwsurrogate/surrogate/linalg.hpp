// cpp/gwsurrogate/surrogate/linalg.hpp
#pragma once
#include <complex>
#include <vector>

#include "../surrogate_params.hpp"

namespace gwsurrogate {

// GSL BLAS 封装；矩阵以 view 方式直接使用 Matrix<T>::data，不拷贝

/// y = B x (gsl_blas_zgemv)
std::vector<std::complex<double>> project(const ComplexMatrix& B,
                                          const std::vector<std::complex<double>>& x);

/// y = B x (gsl_blas_dgemv)
std::vector<double> project(const RealMatrix& B, const std::vector<double>& x);

/// C = A B (gsl_blas_zgemm)
ComplexMatrix multiply(const ComplexMatrix& A, const ComplexMatrix& B);

} // namespace gwsurrogate
