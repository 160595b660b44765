#include "seagas/seawater/teos10_seawater.hpp"
#include <format>
#include <gswteos-10.h>

namespace seagas::seawater {

namespace {
// GSW signals out-of-range input through a sentinel return value
[[nodiscard]] auto checked(double value, std::string_view function) -> std::expected<double, SeawaterError> {
  if (value == GSW_INVALID_VALUE) {
    return std::unexpected(SeawaterError(std::format("{} returned the invalid-value sentinel", function)));
  }
  return value;
}
} // namespace

auto Teos10Seawater::conservative_temperature(double absolute_salinity, double potential_temperature) const
    -> std::expected<double, SeawaterError> {
  return checked(gsw_ct_from_pt(absolute_salinity, potential_temperature), "gsw_ct_from_pt");
}

auto Teos10Seawater::density(double absolute_salinity, double conservative_temperature, double sea_pressure) const
    -> std::expected<double, SeawaterError> {
  return checked(gsw_rho(absolute_salinity, conservative_temperature, sea_pressure), "gsw_rho");
}

auto Teos10Seawater::practical_salinity_from_absolute(double absolute_salinity, double sea_pressure,
                                                      double longitude, double latitude) const
    -> std::expected<double, SeawaterError> {
  return checked(gsw_sp_from_sa(absolute_salinity, sea_pressure, longitude, latitude), "gsw_sp_from_sa");
}

auto Teos10Seawater::potential_temperature_from_conservative(double absolute_salinity,
                                                             double conservative_temperature) const
    -> std::expected<double, SeawaterError> {
  return checked(gsw_pt_from_ct(absolute_salinity, conservative_temperature), "gsw_pt_from_ct");
}

} // namespace seagas::seawater
