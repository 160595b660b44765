#pragma once
#include "../core/broadcast.hpp"
#include "../core/exceptions.hpp"
#include "../core/expected_utils.hpp"
#include "../gas/gas.hpp"
#include "../seawater/seawater_interface.hpp"
#include <expected>
#include <optional>

namespace seagas::transport {

// Eyring fit D0 = A exp(-Ea / (R T)) for gas diffusivity in fresh water
struct ArrheniusCoefficients {
  double pre_exponential;   // A [m^2/s]
  double activation_energy; // Ea [J/mol]
};

/**
 * @brief Arrhenius row of the diffusivity table.
 *
 * Jähne et al. (1987); Ferrell & Himmelblau (1967) for O2 and N2. The CO2 row
 * exists in the table but diffusion_coefficient() never uses it, CO2 goes
 * through co2_schmidt_number(). N2O has no row.
 */
[[nodiscard]] constexpr auto arrhenius_coefficients(gas::Gas gas) noexcept -> std::optional<ArrheniusCoefficients> {
  using gas::Gas;
  switch (gas) {
  case Gas::O2:
    return ArrheniusCoefficients{4.286e-6, 18700.0};
  case Gas::He:
    return ArrheniusCoefficients{0.8180e-6, 11700.0};
  case Gas::Ne:
    return ArrheniusCoefficients{1.6080e-6, 14840.0};
  case Gas::Ar:
    return ArrheniusCoefficients{2.227e-6, 16680.0};
  case Gas::Kr:
    return ArrheniusCoefficients{6.3930e-6, 20200.0};
  case Gas::Xe:
    return ArrheniusCoefficients{9.0070e-6, 21610.0};
  case Gas::N2:
    return ArrheniusCoefficients{3.4120e-6, 18500.0};
  case Gas::CH4:
    return ArrheniusCoefficients{3.0470e-6, 18360.0};
  case Gas::CO2:
    return ArrheniusCoefficients{5.0190e-6, 19510.0};
  case Gas::H2:
    return ArrheniusCoefficients{3.3380e-6, 16060.0};
  case Gas::N2O:
    return std::nullopt;
  }
  return std::nullopt;
}

// Fails with UnsupportedGas for gases that have neither an Arrhenius row nor a Schmidt correlation
[[nodiscard]] auto require_diffusivity_support(gas::Gas gas) -> std::expected<void, core::PropertyError>;

// Arrhenius diffusivity with the linear salinity attenuation (1 - 0.049 SP / 35.5) [m^2/s]
[[nodiscard]] auto arrhenius_diffusivity(double practical_salinity, double potential_temperature,
                                         const ArrheniusCoefficients& coefficients) noexcept -> double;

// Wanninkhof (1992) CO2 Schmidt number, interpolated linearly in SP between fresh water and SP = 35
[[nodiscard]] auto co2_schmidt_number(double practical_salinity, double potential_temperature) noexcept -> double;

/**
 * @brief Molecular diffusion coefficient of a dissolved gas [m^2/s].
 *
 * Arrhenius gases use the table directly and never touch the provider. CO2 is
 * kinematic_viscosity / co2_schmidt_number. N2O is unsupported.
 */
[[nodiscard]] auto diffusion_coefficient(const seawater::SeawaterInterface& seawater, double practical_salinity,
                                         double potential_temperature,
                                         gas::Gas gas) -> std::expected<double, core::PropertyError>;

// Sc = kinematic viscosity / diffusion coefficient; CO2 uses its own correlation
[[nodiscard]] auto schmidt_number(const seawater::SeawaterInterface& seawater, double practical_salinity,
                                  double potential_temperature,
                                  gas::Gas gas) -> std::expected<double, core::PropertyError>;

template <typename S, typename T>
  requires core::ArrayBroadcastPair<S, T>
[[nodiscard]] auto diffusion_coefficient(const seawater::SeawaterInterface& seawater, const S& practical_salinity,
                                         const T& potential_temperature, gas::Gas gas)
    -> std::expected<core::broadcast_result_t<S, T>, core::PropertyError> {
  SEAGAS_TRY_VOID(require_diffusivity_support(gas));
  return core::broadcast(practical_salinity, potential_temperature, [&seawater, gas](double sp, double pt) {
    return diffusion_coefficient(seawater, sp, pt, gas);
  });
}

template <typename S, typename T>
  requires core::ArrayBroadcastPair<S, T>
[[nodiscard]] auto schmidt_number(const seawater::SeawaterInterface& seawater, const S& practical_salinity,
                                  const T& potential_temperature, gas::Gas gas)
    -> std::expected<core::broadcast_result_t<S, T>, core::PropertyError> {
  SEAGAS_TRY_VOID(require_diffusivity_support(gas));
  return core::broadcast(practical_salinity, potential_temperature, [&seawater, gas](double sp, double pt) {
    return schmidt_number(seawater, sp, pt, gas);
  });
}

} // namespace seagas::transport
