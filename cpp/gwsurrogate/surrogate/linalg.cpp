// cpp/gwsurrogate/surrogate/linalg.cpp
#include "linalg.hpp"
#include <string>
#include <gsl/gsl_blas.h>
#include <gsl/gsl_complex_math.h>
#include <gsl/gsl_errno.h>

namespace gwsurrogate {

namespace {

const double* as_doubles(const std::vector<std::complex<double>>& v) {
    return reinterpret_cast<const double*>(v.data());
}

double* as_doubles(std::vector<std::complex<double>>& v) {
    return reinterpret_cast<double*>(v.data());
}

void check_blas(int status, const char* what) {
    if (status != GSL_SUCCESS) {
        throw ConfigurationError(std::string(what) + " failed: " + gsl_strerror(status));
    }
}

} // namespace

std::vector<std::complex<double>> project(const ComplexMatrix& B,
                                          const std::vector<std::complex<double>>& x) {
    if (B.cols != x.size()) {
        throw ConfigurationError("basis has " + std::to_string(B.cols) + " columns, got "
                                 + std::to_string(x.size()) + " coefficients");
    }
    std::vector<std::complex<double>> y(B.rows);
    if (y.empty() || x.empty()) return y;
    gsl_matrix_complex_const_view A = gsl_matrix_complex_const_view_array(as_doubles(B.data), B.rows, B.cols);
    gsl_vector_complex_const_view xv = gsl_vector_complex_const_view_array(as_doubles(x), x.size());
    gsl_vector_complex_view yv = gsl_vector_complex_view_array(as_doubles(y), y.size());

    check_blas(gsl_blas_zgemv(CblasNoTrans, gsl_complex_rect(1.0, 0.0), &A.matrix, &xv.vector,
                              gsl_complex_rect(0.0, 0.0), &yv.vector),
               "gsl_blas_zgemv");
    return y;
}

std::vector<double> project(const RealMatrix& B, const std::vector<double>& x) {
    if (B.cols != x.size()) {
        throw ConfigurationError("basis has " + std::to_string(B.cols) + " columns, got "
                                 + std::to_string(x.size()) + " coefficients");
    }
    std::vector<double> y(B.rows);
    if (y.empty() || x.empty()) return y;
    gsl_matrix_const_view A = gsl_matrix_const_view_array(B.data.data(), B.rows, B.cols);
    gsl_vector_const_view xv = gsl_vector_const_view_array(x.data(), x.size());
    gsl_vector_view yv = gsl_vector_view_array(y.data(), y.size());

    check_blas(gsl_blas_dgemv(CblasNoTrans, 1.0, &A.matrix, &xv.vector, 0.0, &yv.vector),
               "gsl_blas_dgemv");
    return y;
}

ComplexMatrix multiply(const ComplexMatrix& A, const ComplexMatrix& B) {
    if (A.cols != B.rows) {
        throw ConfigurationError("matrix product shape mismatch");
    }
    ComplexMatrix C(A.rows, B.cols);
    if (C.empty() || A.cols == 0) return C;
    gsl_matrix_complex_const_view Av = gsl_matrix_complex_const_view_array(as_doubles(A.data), A.rows, A.cols);
    gsl_matrix_complex_const_view Bv = gsl_matrix_complex_const_view_array(as_doubles(B.data), B.rows, B.cols);
    gsl_matrix_complex_view Cv = gsl_matrix_complex_view_array(as_doubles(C.data), C.rows, C.cols);

    check_blas(gsl_blas_zgemm(CblasNoTrans, CblasNoTrans, gsl_complex_rect(1.0, 0.0),
                              &Av.matrix, &Bv.matrix, gsl_complex_rect(0.0, 0.0), &Cv.matrix),
               "gsl_blas_zgemm");
    return C;
}

} // namespace gwsurrogate
