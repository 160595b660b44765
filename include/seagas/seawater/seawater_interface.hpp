#pragma once
#include "../core/exceptions.hpp"
#include "../io/config_types.hpp"
#include <expected>
#include <memory>
#include <string_view>

namespace seagas::seawater {

// Error type for seawater thermodynamics
class SeawaterError : public core::SeagasException {
public:
  explicit SeawaterError(std::string_view message, std::source_location location = std::source_location::current())
      : SeagasException(std::format("Seawater Error: {}", message), location) {}
};

// Provider of the seawater thermodynamic conversions the property fits rely on.
// Units: SA [g/kg], temperatures [°C], pressures [dbar], positions [degrees].
class SeawaterInterface {
public:
  virtual ~SeawaterInterface() = default;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

  [[nodiscard]] virtual auto conservative_temperature(double absolute_salinity, double potential_temperature) const
      -> std::expected<double, SeawaterError> = 0;

  // In-situ density [kg/m^3]
  [[nodiscard]] virtual auto density(double absolute_salinity, double conservative_temperature,
                                     double sea_pressure) const -> std::expected<double, SeawaterError> = 0;

  [[nodiscard]] virtual auto practical_salinity_from_absolute(double absolute_salinity, double sea_pressure,
                                                              double longitude, double latitude) const
      -> std::expected<double, SeawaterError> = 0;

  [[nodiscard]] virtual auto potential_temperature_from_conservative(double absolute_salinity,
                                                                     double conservative_temperature) const
      -> std::expected<double, SeawaterError> = 0;
};

// Provider failures reach callers of the property API with their message intact
[[nodiscard]] inline auto upstream_failure(const SeawaterError& error) -> core::PropertyError {
  return core::PropertyError(core::PropertyError::Kind::UpstreamFailure, error.message());
}

// Factory function
[[nodiscard]] auto create_seawater(const io::SeawaterConfig& config)
    -> std::expected<std::unique_ptr<SeawaterInterface>, SeawaterError>;

} // namespace seagas::seawater
