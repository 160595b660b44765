#include "seagas/seawater/eos80_seawater.hpp"
#include "seagas/core/constants.hpp"
#include <cmath>
#include <format>

namespace seagas::seawater {

namespace {

// UNESCO (1981), Tenth report of the joint panel on oceanographic tables and standards
namespace unesco {
// Standard mean ocean water
inline constexpr double a0 = 999.842594;
inline constexpr double a1 = 6.793953e-2;
inline constexpr double a2 = -9.095290e-3;
inline constexpr double a3 = 1.001685e-4;
inline constexpr double a4 = -1.120083e-6;
inline constexpr double a5 = 6.536332e-9;

inline constexpr double b0 = 8.2449e-1;
inline constexpr double b1 = -4.0899e-3;
inline constexpr double b2 = 7.6438e-5;
inline constexpr double b3 = -8.2467e-7;
inline constexpr double b4 = 5.3875e-9;

inline constexpr double c0 = -5.7246e-3;
inline constexpr double c1 = 1.0227e-4;
inline constexpr double c2 = -1.6546e-6;

inline constexpr double d0 = 4.8314e-4;

// Pure water secant bulk modulus
inline constexpr double e0 = 19652.21;
inline constexpr double e1 = 148.4206;
inline constexpr double e2 = -2.327105;
inline constexpr double e3 = 1.360477e-2;
inline constexpr double e4 = -5.155288e-5;

inline constexpr double f0 = 54.6746;
inline constexpr double f1 = -0.603459;
inline constexpr double f2 = 1.09987e-2;
inline constexpr double f3 = -6.1670e-5;

inline constexpr double g0 = 7.944e-2;
inline constexpr double g1 = 1.6483e-2;
inline constexpr double g2 = -5.3009e-4;

inline constexpr double h0 = 3.239908;
inline constexpr double h1 = 1.43713e-3;
inline constexpr double h2 = 1.16092e-4;
inline constexpr double h3 = -5.77905e-7;

inline constexpr double i0 = 2.2838e-3;
inline constexpr double i1 = -1.0981e-5;
inline constexpr double i2 = -1.6078e-6;

inline constexpr double j0 = 1.91075e-4;

inline constexpr double k0 = 8.50935e-5;
inline constexpr double k1 = -6.12293e-6;
inline constexpr double k2 = 5.2787e-8;

inline constexpr double m0 = -9.9348e-7;
inline constexpr double m1 = 2.0816e-8;
inline constexpr double m2 = 9.1697e-10;
} // namespace unesco

inline constexpr double max_latitude = 90.0;

[[nodiscard]] auto to_practical(double absolute_salinity) noexcept -> double {
  return absolute_salinity / constants::scales::reference_composition_ratio;
}

[[nodiscard]] auto check_pressure(double sea_pressure) -> std::expected<void, SeawaterError> {
  if (sea_pressure < 0.0) {
    return std::unexpected(SeawaterError(std::format("Sea pressure must be non-negative, got {} dbar", sea_pressure)));
  }
  return {};
}

} // namespace

auto Eos80Seawater::surface_density(double S, double T) noexcept -> double {
  using namespace unesco;
  const double smow = a0 + T * (a1 + T * (a2 + T * (a3 + T * (a4 + a5 * T))));
  const double B1 = b0 + T * (b1 + T * (b2 + T * (b3 + b4 * T)));
  const double C1 = c0 + T * (c1 + c2 * T);
  return smow + B1 * S + C1 * std::pow(S, 1.5) + d0 * S * S;
}

auto Eos80Seawater::secant_bulk_modulus(double S, double T, double p) noexcept -> double {
  using namespace unesco;
  const double Kw = e0 + T * (e1 + T * (e2 + T * (e3 + e4 * T)));
  const double F1 = f0 + T * (f1 + T * (f2 + f3 * T));
  const double G1 = g0 + T * (g1 + g2 * T);
  const double K0 = Kw + F1 * S + G1 * std::pow(S, 1.5);

  const double Aw = h0 + T * (h1 + T * (h2 + h3 * T));
  const double A1 = Aw + (i0 + T * (i1 + i2 * T)) * S + j0 * std::pow(S, 1.5);
  const double Bw = k0 + T * (k1 + k2 * T);
  const double B2 = Bw + (m0 + T * (m1 + m2 * T)) * S;

  return K0 + A1 * p + B2 * p * p;
}

auto Eos80Seawater::conservative_temperature(double /*absolute_salinity*/, double potential_temperature) const
    -> std::expected<double, SeawaterError> {
  return potential_temperature;
}

auto Eos80Seawater::density(double absolute_salinity, double conservative_temperature, double sea_pressure) const
    -> std::expected<double, SeawaterError> {
  if (auto check = check_pressure(sea_pressure); !check) {
    return std::unexpected(check.error());
  }

  const double S = to_practical(absolute_salinity);
  const double T = conservative_temperature;
  const double rho_0 = surface_density(S, T);
  if (sea_pressure == 0.0) {
    return rho_0;
  }

  const double p = sea_pressure * constants::conversion::dbar_to_bar;
  return rho_0 / (1.0 - p / secant_bulk_modulus(S, T, p));
}

auto Eos80Seawater::practical_salinity_from_absolute(double absolute_salinity, double sea_pressure,
                                                     double /*longitude*/, double latitude) const
    -> std::expected<double, SeawaterError> {
  if (auto check = check_pressure(sea_pressure); !check) {
    return std::unexpected(check.error());
  }
  if (std::abs(latitude) > max_latitude) {
    return std::unexpected(SeawaterError(std::format("Latitude {} is outside [-90, 90]", latitude)));
  }
  return to_practical(absolute_salinity);
}

auto Eos80Seawater::potential_temperature_from_conservative(double /*absolute_salinity*/,
                                                            double conservative_temperature) const
    -> std::expected<double, SeawaterError> {
  return conservative_temperature;
}

} // namespace seagas::seawater
