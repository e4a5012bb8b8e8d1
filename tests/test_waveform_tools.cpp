// tests/test_waveform_tools.cpp
#include <gtest/gtest.h>
#include <cmath>
#include <complex>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "waveform/harmonics.hpp"
#include "waveform/waveform_tools.hpp"

using namespace gwsurrogate;

TEST(AffineMapTest, EndpointsAreExact) {
    const std::pair<double, double> iv = {0.1, 0.9};
    EXPECT_EQ(affine_map(0.1, AffineMap::MinusOneToOne, iv), -1.0);
    EXPECT_EQ(affine_map(0.9, AffineMap::MinusOneToOne, iv), 1.0);
    EXPECT_EQ(affine_map(0.1, AffineMap::ZeroToOne, iv), 0.0);
    EXPECT_EQ(affine_map(0.9, AffineMap::ZeroToOne, iv), 1.0);
    EXPECT_EQ(affine_map(0.1, AffineMap::None, iv), 0.1);
    EXPECT_EQ(affine_map(0.9, AffineMap::None, iv), 0.9);
}

TEST(AffineMapTest, Midpoint) {
    const std::pair<double, double> iv = {1.0, 3.0};
    EXPECT_DOUBLE_EQ(affine_map(2.0, AffineMap::MinusOneToOne, iv), 0.0);
    EXPECT_DOUBLE_EQ(affine_map(2.0, AffineMap::ZeroToOne, iv), 0.5);
    EXPECT_TRUE(inside_interval(1.0, iv));
    EXPECT_TRUE(inside_interval(3.0, iv));
    EXPECT_FALSE(inside_interval(3.0001, iv));
}

TEST(AffineMapTest, TagParsing) {
    EXPECT_EQ(parse_affine_map("minus1_to_1"), AffineMap::MinusOneToOne);
    EXPECT_EQ(parse_affine_map("zero_to_1"), AffineMap::ZeroToOne);
    EXPECT_EQ(parse_affine_map("none"), AffineMap::None);
    EXPECT_THROW(parse_affine_map("log"), ConfigurationError);
    EXPECT_EQ(parse_surrogate_mode_type("amp_phase_basis"), SurrogateModeType::AmpPhaseBasis);
    EXPECT_THROW(parse_surrogate_mode_type("spline_basis"), ConfigurationError);
    EXPECT_EQ(parse_parameterization("eta"), Parameterization::SymmetricMassRatio);
    EXPECT_THROW(parse_parameterization("chi"), ConfigurationError);
}

TEST(ParameterizeTest, MassRatioConversions) {
    EXPECT_DOUBLE_EQ(parameterize(2.0, Parameterization::MassRatio), 2.0);
    EXPECT_DOUBLE_EQ(parameterize(1.0, Parameterization::SymmetricMassRatio), 0.25);
    EXPECT_DOUBLE_EQ(parameterize(3.0, Parameterization::SymmetricMassRatio), 3.0 / 16.0);
    EXPECT_DOUBLE_EQ(parameterize(std::exp(1.0), Parameterization::LogMassRatio), 1.0);
}

TEST(ParameterizeTest, NonPositiveMassRatioRejected) {
    EXPECT_THROW(parameterize(0.0, Parameterization::LogMassRatio), ConfigurationError);
    EXPECT_THROW(parameterize(-2.0, Parameterization::LogMassRatio), ConfigurationError);
    EXPECT_THROW(parameterize(-1.0, Parameterization::SymmetricMassRatio), ConfigurationError);
    EXPECT_THROW(parameterize(std::nan(""), Parameterization::LogMassRatio), ConfigurationError);
    EXPECT_DOUBLE_EQ(parameterize(-0.5, Parameterization::MassRatio), -0.5);
}

TEST(AmpPhaseTest, UnwrapsLinearPhase) {
    ComplexSeries h;
    for (int i = 0; i < 100; ++i) {
        h.push_back(std::polar(2.0, 0.4 * i));
    }
    std::vector<double> amp, phase;
    amp_phase(h, amp, phase);
    for (int i = 0; i < 100; ++i) {
        EXPECT_NEAR(amp[i], 2.0, 1e-14);
        EXPECT_NEAR(phase[i], 0.4 * i, 1e-10);
    }
}

TEST(PhaseAlignmentTest, PeakPhaseMatchesReference) {
    ComplexSeries h;
    for (int i = 0; i < 200; ++i) {
        double t = i - 120.0;
        h.push_back(std::polar(std::exp(-t * t / 400.0), -0.3 * t + 1.1));
    }
    const double phi_ref = 2.5;
    ComplexSeries g = adjust_merger_phase(h, phi_ref);
    EXPECT_NEAR(std::remainder(std::arg(g[120]) - phi_ref, 2.0 * M_PI), 0.0, 1e-12);
    EXPECT_NEAR(std::remainder(phi_merger(g) - phi_ref, 2.0 * M_PI), 0.0, 1e-12);
    // 振幅不变
    EXPECT_NEAR(std::abs(g[50]), std::abs(h[50]), 1e-15);
}

TEST(InstantFreqTest, ConstantFrequencyChirp) {
    const double f = 0.02;
    std::vector<double> t, hp, hc;
    for (int i = 0; i < 10; ++i) {
        t.push_back(0.5 * i);
        hp.push_back(std::cos(2.0 * M_PI * f * t.back()));
        hc.push_back(-std::sin(2.0 * M_PI * f * t.back()));
    }
    EXPECT_NEAR(find_instant_freq(hp, hc, t), f, 1e-12);
    EXPECT_THROW(find_instant_freq({1.0}, {0.0}, {0.0}), std::invalid_argument);
}

TEST(HarmonicsTest, MinusTwoSpinWeightedQuadrupole) {
    const double norm = std::sqrt(5.0 / (64.0 * M_PI));
    for (double theta : {0.0, 0.4, M_PI / 2.0, 2.0}) {
        for (double phi : {0.0, 0.9}) {
            std::complex<double> y22 = sYlm(-2, 2, 2, theta, phi);
            std::complex<double> y2m2 = sYlm(-2, 2, -2, theta, phi);
            std::complex<double> e22 = norm * std::pow(1.0 + std::cos(theta), 2)
                                     * std::exp(std::complex<double>(0.0, 2.0 * phi));
            std::complex<double> e2m2 = norm * std::pow(1.0 - std::cos(theta), 2)
                                      * std::exp(std::complex<double>(0.0, -2.0 * phi));
            EXPECT_NEAR(std::abs(y22 - e22), 0.0, 1e-14);
            EXPECT_NEAR(std::abs(y2m2 - e2m2), 0.0, 1e-14);
        }
    }
}

TEST(HarmonicsTest, MinusTwoY21) {
    // -2Y21 = sqrt(5/16pi) sin(theta) (1 + cos(theta)) e^{i phi}
    const double theta = 1.1;
    const double phi = 0.3;
    std::complex<double> expected = std::sqrt(5.0 / (16.0 * M_PI)) * std::sin(theta)
                                  * (1.0 + std::cos(theta)) * std::exp(std::complex<double>(0.0, phi));
    EXPECT_NEAR(std::abs(sYlm(-2, 2, 1, theta, phi) - expected), 0.0, 1e-14);
}

TEST(HarmonicsTest, InvalidIndicesThrow) {
    EXPECT_THROW(sYlm(-2, 1, 0, 0.3, 0.0), ConfigurationError);
    EXPECT_THROW(sYlm(-2, 2, 3, 0.3, 0.0), ConfigurationError);
}

TEST(WriteWaveformTest, TextAndBinary) {
    std::vector<double> t = {0.0, 1.0, 2.0};
    std::vector<double> hp = {1.0, 0.5, 0.25};
    std::vector<double> hc = {0.0, -0.5, 0.125};

    const std::string txt = ::testing::TempDir() + "gwsurrogate_waveform.txt";
    write_waveform(t, hp, hc, txt, "txt");
    std::ifstream in(txt);
    std::string line;
    int rows = 0;
    while (std::getline(in, line)) ++rows;
    EXPECT_EQ(rows, 3);

    const std::string bin = ::testing::TempDir() + "gwsurrogate_waveform.bin";
    write_waveform(t, hp, hc, bin, "bin");
    std::ifstream bin_in(bin, std::ios::binary);
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(bin_in)),
                                     std::istreambuf_iterator<char>());
    ASSERT_EQ(bytes.size(), 8u + 9u * 8u);

    // 小端解码，与主机字节序无关
    auto word_at = [&bytes](std::size_t offset) {
        std::uint64_t w = 0;
        for (int k = 7; k >= 0; --k) w = (w << 8) | bytes[offset + k];
        return w;
    };
    EXPECT_EQ(word_at(0), 3u);
    const std::vector<double> expected = {0.0, 1.0, 2.0, 1.0, 0.5, 0.25, 0.0, -0.5, 0.125};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        std::uint64_t w = word_at(8 + 8 * i);
        double v;
        std::memcpy(&v, &w, sizeof(v));
        EXPECT_EQ(v, expected[i]);
    }
    // 1.0 = 0x3FF0000000000000: 最高字节位于该 8 字节的末尾
    EXPECT_EQ(bytes[8 + 8 * 1 + 7], 0x3F);
    EXPECT_EQ(bytes[8 + 8 * 1 + 6], 0xF0);
    EXPECT_EQ(bytes[8 + 8 * 1], 0x00);

    EXPECT_THROW(write_waveform(t, hp, hc, txt, "npz"), std::invalid_argument);
    std::remove(txt.c_str());
    std::remove(bin.c_str());
}
