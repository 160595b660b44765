#pragma once
#include "seawater_interface.hpp"

namespace seagas::seawater {

/**
 * @brief UNESCO (1981) EOS-80 seawater provider.
 *
 * Density from the one-atmosphere international equation of state with the
 * secant bulk modulus for pressure. Absolute salinity is related to practical
 * salinity through the reference-composition ratio only (no spatial
 * anomaly), and potential/conservative temperature are treated as the same
 * variable since EOS-80 defines no conservative temperature.
 *
 * Out-of-domain salinity or temperature is not rejected: the polynomials are
 * evaluated as-is and NaN propagates.
 */
class Eos80Seawater final : public SeawaterInterface {
public:
  Eos80Seawater() = default;

  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "EOS-80"; }

  [[nodiscard]] auto conservative_temperature(double absolute_salinity, double potential_temperature) const
      -> std::expected<double, SeawaterError> override;

  [[nodiscard]] auto density(double absolute_salinity, double conservative_temperature,
                             double sea_pressure) const -> std::expected<double, SeawaterError> override;

  [[nodiscard]] auto practical_salinity_from_absolute(double absolute_salinity, double sea_pressure, double longitude,
                                                      double latitude) const
      -> std::expected<double, SeawaterError> override;

  [[nodiscard]] auto potential_temperature_from_conservative(double absolute_salinity,
                                                             double conservative_temperature) const
      -> std::expected<double, SeawaterError> override;

  // One-atmosphere density [kg/m^3] at practical salinity S and temperature T [°C]
  [[nodiscard]] static auto surface_density(double practical_salinity, double temperature) noexcept -> double;

  // Secant bulk modulus [bar] at pressure p [bar]
  [[nodiscard]] static auto secant_bulk_modulus(double practical_salinity, double temperature,
                                                double pressure_bar) noexcept -> double;
};

} // namespace seagas::seawater
