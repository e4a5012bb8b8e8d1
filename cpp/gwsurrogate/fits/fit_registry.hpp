// cpp/gwsurrogate/fits/fit_registry.hpp
#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace gwsurrogate {

/// (系数, 映射后的参数 x_0) -> 拟合值
using FitFunction = std::function<double(const std::vector<double>&, double)>;

/// @brief 按名字查找参数化拟合函数
///
/// 求值器在构造时一次性解析名字，求值路径上不再查表。
class FitRegistry {
public:
    FitRegistry() = default;

    /// 内置拟合: polyval_1d, exp_polyval_1d, chebyshev_1d, constant
    static const FitRegistry& builtin();

    /// 同名时覆盖旧函数
    void add(const std::string& name, FitFunction fn);
    bool contains(const std::string& name) const;

    /// 未知名字抛出 ConfigurationError
    const FitFunction& lookup(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, FitFunction> m_funcs;
};

// 内置拟合函数 (也可以单独调用)
double polyval_1d(const std::vector<double>& coeffs, double x);
double exp_polyval_1d(const std::vector<double>& coeffs, double x);
double chebyshev_1d(const std::vector<double>& coeffs, double x);
double constant_1d(const std::vector<double>& coeffs, double x);

} // namespace gwsurrogate
