// cpp/gwsurrogate/fits/fit_registry.cpp
#include "fit_registry.hpp"
#include "../surrogate_params.hpp"
#include <cmath>

namespace gwsurrogate {

// numpy.polyval 约定: coeffs[0] 是最高次项
double polyval_1d(const std::vector<double>& coeffs, double x) {
    double acc = 0.0;
    for (double c : coeffs) {
        acc = acc * x + c;
    }
    return acc;
}

double exp_polyval_1d(const std::vector<double>& coeffs, double x) {
    return std::exp(polyval_1d(coeffs, x));
}

// sum_k c_k T_k(x)，Clenshaw 递推
double chebyshev_1d(const std::vector<double>& coeffs, double x) {
    double b1 = 0.0;
    double b2 = 0.0;
    for (std::size_t k = coeffs.size(); k-- > 1;) {
        double b0 = 2.0 * x * b1 - b2 + coeffs[k];
        b2 = b1;
        b1 = b0;
    }
    return x * b1 - b2 + (coeffs.empty() ? 0.0 : coeffs[0]);
}

double constant_1d(const std::vector<double>& coeffs, double /*x*/) {
    return coeffs.empty() ? 0.0 : coeffs[0];
}

const FitRegistry& FitRegistry::builtin() {
    static const FitRegistry reg = [] {
        FitRegistry r;
        r.add("polyval_1d", &polyval_1d);
        r.add("exp_polyval_1d", &exp_polyval_1d);
        r.add("chebyshev_1d", &chebyshev_1d);
        r.add("constant", &constant_1d);
        return r;
    }();
    return reg;
}

void FitRegistry::add(const std::string& name, FitFunction fn) {
    if (!fn) {
        throw ConfigurationError("fit '" + name + "' is empty");
    }
    m_funcs[name] = std::move(fn);
}

bool FitRegistry::contains(const std::string& name) const {
    return m_funcs.count(name) != 0;
}

const FitFunction& FitRegistry::lookup(const std::string& name) const {
    auto it = m_funcs.find(name);
    if (it == m_funcs.end()) {
        throw ConfigurationError("unknown fit type '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> FitRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(m_funcs.size());
    for (const auto& kv : m_funcs) out.push_back(kv.first);
    return out;
}

} // namespace gwsurrogate
