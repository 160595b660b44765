#pragma once

#include "../core/constants.hpp"
#include <array>
#include <cstddef>

namespace seagas::solubility::coefficients {

// ================================================================================================
// LOG-TEMPERATURE FAMILY
//   y = ln((298.15 - t) / (273.15 + t))
//   ln C = sum_i a_i y^i + SP (sum_j b_j y^j + c SP)
// ================================================================================================

struct LogTemperatureFit {
  std::array<double, 6> a{};
  std::size_t a_terms = 0;
  std::array<double, 4> b{};
  std::size_t b_terms = 0;
  double c = 0.0;
  bool ipts68 = false; // scale t to IPTS-68 before forming y
};

/// Garcia & Gordon (1992), Benson & Krause fit [umol/kg]
inline constexpr LogTemperatureFit oxygen{
    {5.80871, 3.20291, 4.17887, 5.10006, -9.86643e-2, 3.80369},
    6,
    {-7.01577e-3, -7.70028e-3, -1.13864e-2, -9.51519e-3},
    4,
    -2.75915e-7,
    true};

/// Hamme & Emerson (2004) [nmol/kg]
// Reported in the fit's own nmol/kg, unscaled. Not umol/kg like the other gases.
inline constexpr LogTemperatureFit neon{{2.18156, 1.29108, 2.12504}, 3, {-5.94737e-3, -5.13896e-3}, 2, 0.0, false};

/// Hamme & Emerson (2004) [umol/kg]
inline constexpr LogTemperatureFit argon{
    {2.79150, 3.17609, 4.13116, 4.90379}, 4, {-6.96233e-3, -7.66670e-3, -1.16888e-2}, 3, 0.0, false};

/// Hamme & Emerson (2004) [umol/kg]
inline constexpr LogTemperatureFit nitrogen{
    {6.42931, 2.92704, 4.32531, 4.69149}, 4, {-7.44129e-3, -8.02566e-3, -1.46775e-2}, 3, 0.0, false};

// ================================================================================================
// INVERSE-TEMPERATURE (WEISS) FAMILY
//   y = 1.00024 t + 273.15, y100 = y / 100
//   ln C = a0 + a1 100/y + a2 ln(y100) + a3 y100^k + SP (b0 + y100 (b1 + b2 y100))
// ================================================================================================

struct InverseTemperatureFit {
  std::array<double, 4> a{};
  std::array<double, 3> b{};
  int a3_exponent = 1;
  double unit_factor = 1.0;     // applied to exp(ln C)
  bool moist_air_correction = false;
};

/// Weiss (1971), mL/kg scaled to umol/kg
inline constexpr InverseTemperatureFit helium{
    {-167.2178, 216.3442, 139.2032, -22.6202},
    {-0.044781, 0.023541, -0.0034266},
    1,
    constants::conversion::helium_ml_to_umol,
    false};

/// Weiss & Kyser (1978), mL/kg scaled to umol/kg
inline constexpr InverseTemperatureFit krypton{
    {-112.6840, 153.5817, 74.4690, -10.0189},
    {-0.011213, -0.001844, 0.0011201},
    1,
    constants::conversion::krypton_ml_to_umol,
    false};

/// Weiss & Price (1980) [mol/(kg atm)]
inline constexpr InverseTemperatureFit nitrous_oxide{
    {-168.2459, 226.0894, 93.2817, -1.48693}, {-0.060361, 0.033765, -0.0051862}, 2, 1.0, true};

/// Weiss & Price (1980), Table 6 [mol/(kg atm)]
inline constexpr InverseTemperatureFit carbon_dioxide{
    {-162.8301, 218.2968, 90.9241, -1.47696}, {0.025695, -0.025225, 0.0049867}, 2, 1.0, false};

/// Water vapour pressure over seawater, ph2o = exp(m0 - m1 100/y - m2 ln(y100) - m3 SP)
inline constexpr std::array<double, 4> water_vapour{24.4543, 67.4509, 4.8489, 0.000544};

} // namespace seagas::solubility::coefficients
