#pragma once
#include "../core/broadcast.hpp"
#include "../core/exceptions.hpp"
#include "../core/expected_utils.hpp"
#include "../gas/gas.hpp"
#include "../seawater/seawater_interface.hpp"
#include <expected>
#include <string_view>

namespace seagas::solubility {

// Per-gas kernels. Inputs are practical salinity and potential temperature [°C]
// (ITS-90). Outside the fitted range the result may be NaN or Inf.
[[nodiscard]] auto o2_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto ne_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto ar_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto n2_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto he_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto kr_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto n2o_solubility(double practical_salinity, double potential_temperature) noexcept -> double;
[[nodiscard]] auto co2_solubility(double practical_salinity, double potential_temperature) noexcept -> double;

[[nodiscard]] auto is_solubility_supported(gas::Gas gas) noexcept -> bool;

// "umol/kg", "nmol/kg" or "mol/(kg atm)"
[[nodiscard]] auto solubility_units(gas::Gas gas) -> std::expected<std::string_view, core::PropertyError>;

/**
 * @brief Equilibrium solubility of a gas with a standard moist atmosphere.
 *
 * Units depend on the gas, see solubility_units().
 */
[[nodiscard]] auto solubility(double practical_salinity, double potential_temperature,
                              gas::Gas gas) -> std::expected<double, core::PropertyError>;

/**
 * @brief Solubility from absolute salinity and conservative temperature.
 *
 * Converts to SP and pt through the provider and evaluates solubility().
 *
 * @param absolute_salinity SA [g/kg]
 * @param conservative_temperature CT [°C]
 * @param sea_pressure [dbar]
 * @param longitude [degrees east]
 * @param latitude [degrees north]
 */
[[nodiscard]] auto solubility_from_absolute(const seawater::SeawaterInterface& seawater, double absolute_salinity,
                                            double conservative_temperature, double sea_pressure, double longitude,
                                            double latitude, gas::Gas gas)
    -> std::expected<double, core::PropertyError>;

template <typename S, typename T>
  requires core::ArrayBroadcastPair<S, T>
[[nodiscard]] auto solubility(const S& practical_salinity, const T& potential_temperature, gas::Gas gas)
    -> std::expected<core::broadcast_result_t<S, T>, core::PropertyError> {
  SEAGAS_TRY_VOID(solubility_units(gas));
  return core::broadcast(practical_salinity, potential_temperature,
                         [gas](double sp, double pt) { return solubility(sp, pt, gas); });
}

} // namespace seagas::solubility
