// cpp/gwsurrogate/waveform/waveform_tools.cpp
#include "waveform_tools.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace gwsurrogate {

namespace {

// 按小端字节序写出 64 位字，与主机字节序无关
void write_le64(std::ostream& out, std::uint64_t word) {
    char bytes[8];
    for (int k = 0; k < 8; ++k) {
        bytes[k] = static_cast<char>((word >> (8 * k)) & 0xffu);
    }
    out.write(bytes, 8);
}

void write_le_double(std::ostream& out, double v) {
    std::uint64_t word;
    std::memcpy(&word, &v, sizeof(word));
    write_le64(out, word);
}

} // namespace

double parameterize(double q, Parameterization p) {
    if (p != Parameterization::MassRatio && !(q > 0.0)) {
        throw ConfigurationError("mass ratio must be positive for eta / log_q parameterization (got "
                                 + std::to_string(q) + ")");
    }
    switch (p) {
        case Parameterization::MassRatio:
            return q;
        case Parameterization::SymmetricMassRatio:
            return q / ((1.0 + q) * (1.0 + q));
        case Parameterization::LogMassRatio:
            return std::log(q);
    }
    throw ConfigurationError("unknown parameterization");
}

double affine_map(double x, AffineMap map, const std::pair<double, double>& interval) {
    const double x_min = interval.first;
    const double x_max = interval.second;
    switch (map) {
        case AffineMap::MinusOneToOne:
            return 2.0 * (x - x_min) / (x_max - x_min) - 1.0;
        case AffineMap::ZeroToOne:
            return (x - x_min) / (x_max - x_min);
        case AffineMap::None:
            return x;
    }
    throw ConfigurationError("unknown affine map");
}

bool inside_interval(double x, const std::pair<double, double>& interval) {
    return !(x < interval.first || x > interval.second);
}

void amp_phase(const ComplexSeries& h, std::vector<double>& amp, std::vector<double>& phase) {
    const std::size_t n = h.size();
    amp.resize(n);
    phase.resize(n);
    double offset = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        amp[i] = std::abs(h[i]);
        double raw = std::arg(h[i]);
        if (i > 0) {
            // unwrap: 相邻点的跳变限制在 (-pi, pi]
            double d = raw + offset - phase[i - 1];
            if (d > M_PI) {
                offset -= 2.0 * M_PI * std::ceil((d - M_PI) / (2.0 * M_PI));
            } else if (d < -M_PI) {
                offset += 2.0 * M_PI * std::ceil((-d - M_PI) / (2.0 * M_PI));
            }
        }
        phase[i] = raw + offset;
    }
}

double phi_merger(const ComplexSeries& h) {
    if (h.empty()) {
        throw std::invalid_argument("phi_merger: empty waveform");
    }
    std::vector<double> amp, phase;
    amp_phase(h, amp, phase);
    std::size_t argmax = static_cast<std::size_t>(
        std::distance(amp.begin(), std::max_element(amp.begin(), amp.end())));
    return phase[argmax];
}

ComplexSeries modify_phase(const ComplexSeries& h, double dphi) {
    const std::complex<double> rot = std::polar(1.0, dphi);
    ComplexSeries out(h.size());
    for (std::size_t i = 0; i < h.size(); ++i) {
        out[i] = h[i] * rot;
    }
    return out;
}

ComplexSeries adjust_merger_phase(const ComplexSeries& h, double phi_ref) {
    double phiadj = phi_ref - phi_merger(h);
    return modify_phase(h, phiadj);
}

double find_instant_freq(const std::vector<double>& hp,
                         const std::vector<double>& hc,
                         const std::vector<double>& t) {
    if (hp.size() < 2 || hp.size() != hc.size() || hp.size() != t.size()) {
        throw std::invalid_argument("find_instant_freq: need >= 2 samples of matching length");
    }
    ComplexSeries head = {{hp[0], hc[0]}, {hp[1], hc[1]}};
    std::vector<double> amp, phase;
    amp_phase(head, amp, phase);
    return std::abs((phase[1] - phase[0]) / (t[1] - t[0])) / (2.0 * M_PI);
}

ComplexSeries to_complex(const std::vector<double>& hp, const std::vector<double>& hc) {
    ComplexSeries h(hp.size());
    for (std::size_t i = 0; i < hp.size(); ++i) {
        h[i] = {hp[i], hc[i]};
    }
    return h;
}

void write_waveform(const std::vector<double>& t,
                    const std::vector<double>& hp,
                    const std::vector<double>& hc,
                    const std::string& filename,
                    const std::string& ext) {
    if (t.size() != hp.size() || t.size() != hc.size()) {
        throw std::invalid_argument("write_waveform: arrays differ in length");
    }

    if (ext == "txt") {
        std::ofstream out(filename);
        if (!out) throw std::runtime_error("cannot open " + filename);
        out << std::setprecision(17) << std::scientific;
        for (const auto* row : {&t, &hp, &hc}) {
            for (std::size_t i = 0; i < row->size(); ++i) {
                if (i) out << ' ';
                out << (*row)[i];
            }
            out << '\n';
        }
    } else if (ext == "bin") {
        std::ofstream out(filename, std::ios::binary);
        if (!out) throw std::runtime_error("cannot open " + filename);
        write_le64(out, static_cast<std::uint64_t>(t.size()));
        for (const auto* row : {&t, &hp, &hc}) {
            for (double v : *row) write_le_double(out, v);
        }
        if (!out) throw std::runtime_error("write failed: " + filename);
    } else {
        throw std::invalid_argument("not a valid file extension: " + ext);
    }
}

} // namespace gwsurrogate
