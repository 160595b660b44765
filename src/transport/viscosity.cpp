#include "seagas/transport/viscosity.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/core/expected_utils.hpp"

namespace seagas::transport {

namespace {
inline constexpr double mu_0 = 17.91;
inline constexpr double mu_t = -0.5381;
inline constexpr double mu_tt = 0.00694;
inline constexpr double mu_s = 0.02305;
} // namespace

auto kinematic_viscosity(const seawater::SeawaterInterface& seawater, double practical_salinity,
                         double potential_temperature) -> std::expected<double, core::PropertyError> {
  const double absolute_salinity = practical_salinity * constants::scales::reference_composition_ratio;

  double conservative_temperature = 0.0;
  SEAGAS_TRY_ASSIGN_MAP(conservative_temperature,
                        seawater.conservative_temperature(absolute_salinity, potential_temperature),
                        seawater::upstream_failure);

  double rho = 0.0;
  SEAGAS_TRY_ASSIGN_MAP(rho, seawater.density(absolute_salinity, conservative_temperature, 0.0),
                        seawater::upstream_failure);

  const double t = potential_temperature;
  const double dynamic_viscosity =
      constants::conversion::viscosity_polynomial_scale * (mu_0 + t * (mu_t + mu_tt * t) + mu_s * practical_salinity);
  return dynamic_viscosity / rho;
}

} // namespace seagas::transport
