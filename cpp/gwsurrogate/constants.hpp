// cpp/gwsurrogate/constants.hpp
#pragma once

namespace gwsurrogate {
namespace mks {

// SI 单位
constexpr double G = 6.67384e-11;             // m^3 kg^-1 s^-2
constexpr double c = 2.99792458e8;            // m / s
constexpr double Msun = 1.98855e30;           // kg
constexpr double Msuninsec = 4.925491e-6;     // G * Msun / c^3, s
constexpr double Mpcinm = 3.08567758e22;      // m

} // namespace mks
} // namespace gwsurrogate
