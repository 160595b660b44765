#include "seagas/solubility/solubility.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/solubility/solubility_coefficients.hpp"
#include <cmath>
#include <format>

namespace seagas::solubility {

namespace {

namespace units {
inline constexpr std::string_view micromole = "umol/kg";
inline constexpr std::string_view nanomole = "nmol/kg";
inline constexpr std::string_view mole_per_atmosphere = "mol/(kg atm)";
} // namespace units

// sum_{i < n} c_i y^i by Horner's rule
template <std::size_t N>
[[nodiscard]] constexpr auto polynomial(const std::array<double, N>& c, std::size_t n, double y) noexcept -> double {
  double result = 0.0;
  for (std::size_t i = n; i-- > 0;) {
    result = c[i] + y * result;
  }
  return result;
}

[[nodiscard]] auto evaluate(const coefficients::LogTemperatureFit& fit, double SP, double pt) noexcept -> double {
  const double t = fit.ipts68 ? pt * constants::scales::its90_to_ipts68 : pt;
  const double y = std::log((constants::physical::scaled_temperature_reference - t) /
                            (constants::physical::celsius_to_kelvin + t));
  const double ln_c = polynomial(fit.a, fit.a_terms, y) + SP * (polynomial(fit.b, fit.b_terms, y) + fit.c * SP);
  return std::exp(ln_c);
}

[[nodiscard]] auto evaluate(const coefficients::InverseTemperatureFit& fit, double SP, double pt) noexcept -> double {
  const double y = pt * constants::scales::its90_to_ipts68 + constants::physical::celsius_to_kelvin;
  const double y100 = y / 100.0;
  const auto& a = fit.a;
  const auto& b = fit.b;

  const double ln_c = a[0] + a[1] * 100.0 / y + a[2] * std::log(y100) + a[3] * std::pow(y100, fit.a3_exponent) +
                      SP * (b[0] + y100 * (b[1] + b[2] * y100));
  double result = std::exp(ln_c) * fit.unit_factor;

  if (fit.moist_air_correction) {
    const auto& m = coefficients::water_vapour;
    const double ph2o = std::exp(m[0] - m[1] * 100.0 / y - m[2] * std::log(y100) - m[3] * SP);
    result /= (1.0 - ph2o);
  }
  return result;
}

[[nodiscard]] auto unsupported(gas::Gas gas) -> core::PropertyError {
  return core::PropertyError(core::PropertyError::Kind::UnsupportedGas,
                             std::format("Gas '{}' is not supported for solubility", gas::symbol(gas)));
}

} // namespace

auto o2_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::oxygen, SP, pt); }
auto ne_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::neon, SP, pt); }
auto ar_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::argon, SP, pt); }
auto n2_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::nitrogen, SP, pt); }
auto he_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::helium, SP, pt); }
auto kr_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::krypton, SP, pt); }
auto n2o_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::nitrous_oxide, SP, pt); }
auto co2_solubility(double SP, double pt) noexcept -> double { return evaluate(coefficients::carbon_dioxide, SP, pt); }

auto is_solubility_supported(gas::Gas gas) noexcept -> bool {
  using gas::Gas;
  switch (gas) {
  case Gas::O2:
  case Gas::Ne:
  case Gas::Ar:
  case Gas::N2:
  case Gas::He:
  case Gas::Kr:
  case Gas::N2O:
  case Gas::CO2:
    return true;
  case Gas::Xe:
  case Gas::CH4:
  case Gas::H2:
    return false;
  }
  return false;
}

auto solubility_units(gas::Gas gas) -> std::expected<std::string_view, core::PropertyError> {
  using gas::Gas;
  switch (gas) {
  case Gas::O2:
  case Gas::Ar:
  case Gas::N2:
  case Gas::He:
  case Gas::Kr:
    return units::micromole;
  case Gas::Ne:
    return units::nanomole;
  case Gas::N2O:
  case Gas::CO2:
    return units::mole_per_atmosphere;
  case Gas::Xe:
  case Gas::CH4:
  case Gas::H2:
    return std::unexpected(unsupported(gas));
  }
  return std::unexpected(unsupported(gas));
}

auto solubility(double practical_salinity, double potential_temperature,
                gas::Gas gas) -> std::expected<double, core::PropertyError> {
  using gas::Gas;
  switch (gas) {
  case Gas::O2:
    return o2_solubility(practical_salinity, potential_temperature);
  case Gas::Ne:
    return ne_solubility(practical_salinity, potential_temperature);
  case Gas::Ar:
    return ar_solubility(practical_salinity, potential_temperature);
  case Gas::N2:
    return n2_solubility(practical_salinity, potential_temperature);
  case Gas::He:
    return he_solubility(practical_salinity, potential_temperature);
  case Gas::Kr:
    return kr_solubility(practical_salinity, potential_temperature);
  case Gas::N2O:
    return n2o_solubility(practical_salinity, potential_temperature);
  case Gas::CO2:
    return co2_solubility(practical_salinity, potential_temperature);
  case Gas::Xe:
  case Gas::CH4:
  case Gas::H2:
    return std::unexpected(unsupported(gas));
  }
  return std::unexpected(unsupported(gas));
}

auto solubility_from_absolute(const seawater::SeawaterInterface& seawater, double absolute_salinity,
                              double conservative_temperature, double sea_pressure, double longitude, double latitude,
                              gas::Gas gas) -> std::expected<double, core::PropertyError> {
  if (!is_solubility_supported(gas)) {
    return std::unexpected(unsupported(gas));
  }

  double practical_salinity = 0.0;
  SEAGAS_TRY_ASSIGN_MAP(practical_salinity,
                        seawater.practical_salinity_from_absolute(absolute_salinity, sea_pressure, longitude, latitude),
                        seawater::upstream_failure);

  double potential_temperature = 0.0;
  SEAGAS_TRY_ASSIGN_MAP(potential_temperature,
                        seawater.potential_temperature_from_conservative(absolute_salinity, conservative_temperature),
                        seawater::upstream_failure);

  return solubility(practical_salinity, potential_temperature, gas);
}

} // namespace seagas::solubility
