#include "seagas/transport/diffusivity.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/core/expected_utils.hpp"
#include "seagas/transport/viscosity.hpp"
#include <cmath>
#include <format>

namespace seagas::transport {

namespace {

// Sc = A - B t + C t^2 - D t^3
struct SchmidtPolynomial {
  double a;
  double b;
  double c;
  double d;

  [[nodiscard]] constexpr auto operator()(double t) const noexcept -> double { return a - t * (b - t * (c - d * t)); }
};

inline constexpr SchmidtPolynomial co2_fresh_water{1911.1, 118.11, 3.4527, 0.041320};
inline constexpr SchmidtPolynomial co2_seawater{2073.1, 125.62, 3.6276, 0.043219};

[[nodiscard]] auto unsupported(gas::Gas gas) -> core::PropertyError {
  return core::PropertyError(core::PropertyError::Kind::UnsupportedGas,
                             std::format("Gas '{}' is not supported for diffusivity", gas::symbol(gas)));
}

} // namespace

auto require_diffusivity_support(gas::Gas gas) -> std::expected<void, core::PropertyError> {
  if (gas != gas::Gas::CO2 && !arrhenius_coefficients(gas)) {
    return std::unexpected(unsupported(gas));
  }
  return {};
}

auto arrhenius_diffusivity(double practical_salinity, double potential_temperature,
                           const ArrheniusCoefficients& coefficients) noexcept -> double {
  const double temperature_kelvin = potential_temperature + constants::physical::celsius_to_kelvin;
  const double fresh_water = coefficients.pre_exponential *
                             std::exp(-coefficients.activation_energy /
                                      (constants::physical::gas_constant * temperature_kelvin));
  return fresh_water * (1.0 - constants::diffusion::salinity_attenuation * practical_salinity /
                                  constants::diffusion::attenuation_reference_salinity);
}

auto co2_schmidt_number(double practical_salinity, double potential_temperature) noexcept -> double {
  const double fresh = co2_fresh_water(potential_temperature);
  const double sea = co2_seawater(potential_temperature);
  return fresh + (sea - fresh) * practical_salinity / constants::scales::reference_practical_salinity;
}

auto diffusion_coefficient(const seawater::SeawaterInterface& seawater, double practical_salinity,
                           double potential_temperature, gas::Gas gas) -> std::expected<double, core::PropertyError> {
  using gas::Gas;
  switch (gas) {
  case Gas::O2:
  case Gas::He:
  case Gas::Ne:
  case Gas::Ar:
  case Gas::Kr:
  case Gas::Xe:
  case Gas::N2:
  case Gas::CH4:
  case Gas::H2:
    return arrhenius_diffusivity(practical_salinity, potential_temperature, *arrhenius_coefficients(gas));
  case Gas::CO2: {
    double nu = 0.0;
    SEAGAS_TRY_ASSIGN(nu, kinematic_viscosity(seawater, practical_salinity, potential_temperature));
    return nu / co2_schmidt_number(practical_salinity, potential_temperature);
  }
  case Gas::N2O:
    return std::unexpected(unsupported(gas));
  }
  return std::unexpected(unsupported(gas));
}

auto schmidt_number(const seawater::SeawaterInterface& seawater, double practical_salinity,
                    double potential_temperature, gas::Gas gas) -> std::expected<double, core::PropertyError> {
  if (gas == gas::Gas::CO2) {
    return co2_schmidt_number(practical_salinity, potential_temperature);
  }

  double diffusivity = 0.0;
  SEAGAS_TRY_ASSIGN(diffusivity, diffusion_coefficient(seawater, practical_salinity, potential_temperature, gas));

  double nu = 0.0;
  SEAGAS_TRY_ASSIGN(nu, kinematic_viscosity(seawater, practical_salinity, potential_temperature));
  return nu / diffusivity;
}

} // namespace seagas::transport
