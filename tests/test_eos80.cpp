#include "seagas/core/constants.hpp"
#include "seagas/seawater/eos80_seawater.hpp"
#include "seagas/seawater/seawater_interface.hpp"
#include "test_utils.hpp"
#include <limits>

using seagas::seawater::Eos80Seawater;
using seagas::test::check;
using seagas::test::check_close;

namespace {

constexpr double ratio = seagas::constants::scales::reference_composition_ratio;

void test_surface_density() {
  // UNESCO (1981) check values
  check_close(Eos80Seawater::surface_density(35.0, 20.0), 1024.762912618, 1e-10, "rho(35, 20, 0)");
  check_close(Eos80Seawater::surface_density(0.0, 4.0), 999.974958216, 1e-10, "rho(0, 4, 0)");
  check_close(Eos80Seawater::surface_density(35.0, 25.0), 1023.342966151, 1e-10, "rho(35, 25, 0)");
}

void test_density_through_interface() {
  Eos80Seawater eos80;
  const seagas::seawater::SeawaterInterface& provider = eos80;
  check(provider.name() == "EOS-80", "provider name");

  auto surface = provider.density(35.0 * ratio, 20.0, 0.0);
  check(surface.has_value(), "surface density evaluates");
  if (surface) {
    check_close(*surface, 1024.762912618, 1e-10, "interface density at zero pressure");
  }

  auto deep = provider.density(35.0 * ratio, 25.0, 10000.0);
  check(deep.has_value(), "density at 10000 dbar evaluates");
  if (deep) {
    check(std::abs(*deep - 1062.5380759) < 5e-3, "rho(35, 25, 10000 dbar)");
  }

  auto compressed = provider.density(35.0 * ratio, 10.0, 2000.0);
  auto uncompressed = provider.density(35.0 * ratio, 10.0, 0.0);
  check(compressed && uncompressed && *compressed > *uncompressed, "density increases with pressure");
}

void test_temperature_identities() {
  Eos80Seawater eos80;
  auto ct = eos80.conservative_temperature(35.0 * ratio, 12.5);
  check(ct && *ct == 12.5, "conservative temperature equals potential temperature");
  auto pt = eos80.potential_temperature_from_conservative(35.0 * ratio, 12.5);
  check(pt && *pt == 12.5, "potential temperature equals conservative temperature");

  auto sp = eos80.practical_salinity_from_absolute(35.16504, 100.0, 0.0, 0.0);
  check(sp.has_value(), "practical salinity evaluates");
  if (sp) {
    check_close(*sp, 35.0, 1e-12, "reference-composition salinity conversion");
  }
}

void test_rejections() {
  Eos80Seawater eos80;

  auto negative_pressure = eos80.density(35.0, 10.0, -1.0);
  check(!negative_pressure, "negative sea pressure rejected by density");
  if (!negative_pressure) {
    check(negative_pressure.error().message().starts_with("Seawater Error: "), "error carries the seawater prefix");
  }

  check(!eos80.practical_salinity_from_absolute(35.0, -5.0, 0.0, 0.0), "negative sea pressure rejected by SP");
  check(!eos80.practical_salinity_from_absolute(35.0, 0.0, 0.0, 91.0), "latitude above 90 rejected");
  check(!eos80.practical_salinity_from_absolute(35.0, 0.0, 0.0, -90.5), "latitude below -90 rejected");
  check(eos80.practical_salinity_from_absolute(35.0, 0.0, 0.0, 90.0).has_value(), "latitude 90 accepted");

  // Out-of-domain state variables are evaluated, NaN propagates
  auto nan_density = eos80.density(std::numeric_limits<double>::quiet_NaN(), 10.0, 0.0);
  check(nan_density.has_value() && std::isnan(*nan_density), "NaN salinity propagates");
}

} // namespace

int main() {
  test_surface_density();
  test_density_through_interface();
  test_temperature_identities();
  test_rejections();
  return seagas::test::finish();
}
