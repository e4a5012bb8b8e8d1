// tests/test_fit_registry.cpp
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "fits/fit_registry.hpp"
#include "surrogate_params.hpp"

using namespace gwsurrogate;

TEST(FitRegistryTest, PolyvalUsesHighestPowerFirst) {
    // 2x^2 - 3x + 1
    std::vector<double> c = {2.0, -3.0, 1.0};
    EXPECT_DOUBLE_EQ(polyval_1d(c, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(polyval_1d(c, 2.0), 3.0);
    EXPECT_DOUBLE_EQ(polyval_1d(c, -1.0), 6.0);
}

TEST(FitRegistryTest, ExpPolyval) {
    std::vector<double> c = {1.0, 0.5};
    EXPECT_NEAR(exp_polyval_1d(c, 2.0), std::exp(2.5), 1e-12);
}

TEST(FitRegistryTest, ChebyshevMatchesExplicitPolynomials) {
    // T0 = 1, T1 = x, T2 = 2x^2 - 1, T3 = 4x^3 - 3x
    std::vector<double> c = {0.5, -1.0, 2.0, 0.25};
    for (double x : {-1.0, -0.3, 0.0, 0.7, 1.0}) {
        double expected = 0.5 - x + 2.0 * (2.0 * x * x - 1.0) + 0.25 * (4.0 * x * x * x - 3.0 * x);
        EXPECT_NEAR(chebyshev_1d(c, x), expected, 1e-14);
    }
    EXPECT_DOUBLE_EQ(chebyshev_1d({3.0}, 0.4), 3.0);
}

TEST(FitRegistryTest, BuiltinCatalogue) {
    const FitRegistry& reg = FitRegistry::builtin();
    EXPECT_TRUE(reg.contains("polyval_1d"));
    EXPECT_TRUE(reg.contains("exp_polyval_1d"));
    EXPECT_TRUE(reg.contains("chebyshev_1d"));
    EXPECT_TRUE(reg.contains("constant"));
    EXPECT_DOUBLE_EQ(reg.lookup("constant")({4.0}, 123.0), 4.0);
    EXPECT_EQ(reg.names().size(), 4u);
}

TEST(FitRegistryTest, UnknownNameIsConfigurationError) {
    EXPECT_THROW(FitRegistry::builtin().lookup("ampfitfn9_1d"), ConfigurationError);
}

TEST(FitRegistryTest, CustomFitsCanBeRegistered) {
    FitRegistry reg;
    reg.add("linear_sum", [](const std::vector<double>& c, double x) { return c[0] + c[1] * x; });
    ASSERT_TRUE(reg.contains("linear_sum"));
    EXPECT_DOUBLE_EQ(reg.lookup("linear_sum")({1.0, 2.0}, 3.0), 7.0);
    EXPECT_THROW(reg.add("empty", FitFunction()), ConfigurationError);
}
