#pragma once
#include "../core/broadcast.hpp"
#include "../core/exceptions.hpp"
#include "../seawater/seawater_interface.hpp"
#include <expected>

namespace seagas::transport {

/**
 * @brief Kinematic viscosity of seawater [m^2/s].
 *
 * Dynamic viscosity 1e-4 (17.91 - 0.5381 pt + 0.00694 pt^2 + 0.02305 SP)
 * divided by the in-situ density at zero sea pressure from the provider.
 *
 * @param seawater Thermodynamic provider (conversion to CT, density)
 * @param practical_salinity SP [-]
 * @param potential_temperature pt [°C]
 */
[[nodiscard]] auto kinematic_viscosity(const seawater::SeawaterInterface& seawater, double practical_salinity,
                                       double potential_temperature) -> std::expected<double, core::PropertyError>;

template <typename S, typename T>
  requires core::ArrayBroadcastPair<S, T>
[[nodiscard]] auto kinematic_viscosity(const seawater::SeawaterInterface& seawater, const S& practical_salinity,
                                       const T& potential_temperature)
    -> std::expected<core::broadcast_result_t<S, T>, core::PropertyError> {
  return core::broadcast(practical_salinity, potential_temperature,
                         [&seawater](double sp, double pt) { return kinematic_viscosity(seawater, sp, pt); });
}

} // namespace seagas::transport
