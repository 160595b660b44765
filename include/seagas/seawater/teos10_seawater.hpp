#pragma once
#include "seawater_interface.hpp"

namespace seagas::seawater {

// TEOS-10 provider backed by the GSW C library
class Teos10Seawater final : public SeawaterInterface {
public:
  Teos10Seawater() = default;

  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "TEOS-10 (GSW)"; }

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
};

} // namespace seagas::seawater
