#include "seagas/seawater/eos80_seawater.hpp"
#include "seagas/transport/diffusivity.hpp"
#include "seagas/transport/viscosity.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <vector>

using seagas::core::PropertyError;
using seagas::gas::Gas;
using seagas::test::check;
using seagas::test::check_close;

namespace {

const seagas::seawater::Eos80Seawater eos80;

void test_arrhenius_values() {
  struct Case {
    Gas gas;
    double expected;
  };
  const std::vector<Case> cases = {
      {Gas::O2, 1.899288582e-9}, {Gas::He, 6.405435211e-9}, {Gas::H2, 4.369371999e-9},
      {Gas::Xe, 1.209529843e-9}, {Gas::CH4, 1.552359405e-9},
  };
  for (const auto& c : cases) {
    auto d = seagas::transport::diffusion_coefficient(eos80, 35.0, 20.0, c.gas);
    check(d.has_value(), std::format("{} diffusivity evaluates", seagas::gas::symbol(c.gas)));
    if (d) {
      check_close(*d, c.expected, 1e-6, std::format("{} diffusivity at SP=35, pt=20", seagas::gas::symbol(c.gas)));
    }
  }
}

void test_co2_uses_schmidt_correlation() {
  auto d = seagas::transport::diffusion_coefficient(eos80, 35.0, 20.0, Gas::CO2);
  auto nu = seagas::transport::kinematic_viscosity(eos80, 35.0, 20.0);
  check(d.has_value() && nu.has_value(), "CO2 diffusivity and viscosity evaluate");
  if (!d || !nu) {
    return;
  }

  check_close(*d, 1.572317592e-9, 1e-6, "CO2 diffusivity at SP=35, pt=20");
  check_close(*d, *nu / seagas::transport::co2_schmidt_number(35.0, 20.0), 1e-12, "CO2 diffusivity is nu / Sc");

  // The table row for CO2 is never consulted
  const auto row = *seagas::transport::arrhenius_coefficients(Gas::CO2);
  const double arrhenius = seagas::transport::arrhenius_diffusivity(35.0, 20.0, row);
  check_close(arrhenius, 1.595256731e-9, 1e-6, "CO2 Arrhenius row value");
  check(std::abs(*d - arrhenius) / arrhenius > 1e-3, "CO2 diffusivity differs from its Arrhenius row");
}

void test_co2_schmidt_number() {
  check_close(seagas::transport::co2_schmidt_number(35.0, 20.0), 665.988, 1e-9, "Sc(CO2) at SP=35, pt=20");
  check_close(seagas::transport::co2_schmidt_number(0.0, 20.0), 599.42, 1e-9, "Sc(CO2) fresh water at pt=20");
  check_close(seagas::transport::co2_schmidt_number(0.0, 0.0), 1911.1, 1e-12, "Sc(CO2) fresh water at pt=0");

  auto sc = seagas::transport::schmidt_number(eos80, 35.0, 20.0, Gas::CO2);
  check(sc.has_value(), "schmidt_number(CO2) evaluates");
  if (sc) {
    check_close(*sc, 665.988, 1e-9, "schmidt_number(CO2) is the Wanninkhof correlation");
  }
}

void test_schmidt_definition() {
  for (auto gas : {Gas::O2, Gas::N2, Gas::Ar, Gas::He, Gas::Kr}) {
    auto sc = seagas::transport::schmidt_number(eos80, 30.0, 15.0, gas);
    auto d = seagas::transport::diffusion_coefficient(eos80, 30.0, 15.0, gas);
    auto nu = seagas::transport::kinematic_viscosity(eos80, 30.0, 15.0);
    check(sc && d && nu, std::format("{} Schmidt number evaluates", seagas::gas::symbol(gas)));
    if (sc && d && nu) {
      check_close(*sc, *nu / *d, 1e-12, std::format("{} Schmidt number equals nu / D", seagas::gas::symbol(gas)));
      check(*sc > 100.0 && *sc < 3000.0, std::format("{} Schmidt number in the physical range", seagas::gas::symbol(gas)));
    }
  }
}

void test_trends() {
  // Warmer water diffuses faster, saltier water slower
  for (auto gas : {Gas::O2, Gas::He, Gas::CO2}) {
    auto cold = *seagas::transport::diffusion_coefficient(eos80, 35.0, 5.0, gas);
    auto warm = *seagas::transport::diffusion_coefficient(eos80, 35.0, 25.0, gas);
    check(warm > cold, std::format("{} diffusivity increases with temperature", seagas::gas::symbol(gas)));
  }
  auto fresh = *seagas::transport::diffusion_coefficient(eos80, 0.0, 20.0, Gas::O2);
  auto salty = *seagas::transport::diffusion_coefficient(eos80, 35.0, 20.0, Gas::O2);
  check(salty < fresh, "O2 diffusivity decreases with salinity");
  check_close(salty / fresh, 1.0 - 0.049 * 35.0 / 35.5, 1e-12, "salinity attenuation factor");
}

void test_positive_and_salinity_monotonic() {
  for (auto gas : seagas::gas::all_gases()) {
    if (gas == Gas::N2O) {
      continue;
    }
    const auto name = seagas::gas::symbol(gas);
    const bool arrhenius_family = gas != Gas::CO2 && seagas::transport::arrhenius_coefficients(gas).has_value();
    bool evaluates = true;
    bool positive = true;
    bool fresher_diffuses_faster = true;
    for (double sp = 0.0; sp <= 40.0; sp += 5.0) {
      for (double pt = -2.0; pt <= 40.0; pt += 2.0) {
        auto d = seagas::transport::diffusion_coefficient(eos80, sp, pt, gas);
        if (!d) {
          evaluates = false;
          continue;
        }
        positive = positive && std::isfinite(*d) && *d > 0.0;
        if (arrhenius_family && sp + 5.0 <= 40.0) {
          auto saltier = seagas::transport::diffusion_coefficient(eos80, sp + 5.0, pt, gas);
          fresher_diffuses_faster = fresher_diffuses_faster && saltier && *saltier < *d;
        }
      }
    }
    check(evaluates, std::format("{} diffusivity evaluates over the oceanic range", name));
    check(positive, std::format("{} diffusivity positive over the oceanic range", name));
    if (arrhenius_family) {
      check(fresher_diffuses_faster, std::format("{} diffusivity decreases with salinity", name));
    }
  }
}

void test_n2o_unsupported() {
  check(!seagas::transport::arrhenius_coefficients(Gas::N2O).has_value(), "N2O has no Arrhenius row");

  auto d = seagas::transport::diffusion_coefficient(eos80, 35.0, 20.0, Gas::N2O);
  check(!d && d.error().kind() == PropertyError::Kind::UnsupportedGas, "N2O diffusivity reports UnsupportedGas");

  auto sc = seagas::transport::schmidt_number(eos80, 35.0, 20.0, Gas::N2O);
  check(!sc && sc.error().kind() == PropertyError::Kind::UnsupportedGas, "N2O Schmidt number reports UnsupportedGas");

  auto empty = seagas::transport::diffusion_coefficient(eos80, std::vector<double>{}, 20.0, Gas::N2O);
  check(!empty && empty.error().kind() == PropertyError::Kind::UnsupportedGas,
        "N2O array diffusivity reports UnsupportedGas");
}

void test_array_inputs() {
  std::vector<double> temperature{0.0, 10.0, 20.0, 30.0};
  auto d = seagas::transport::diffusion_coefficient(eos80, 35.0, temperature, Gas::O2);
  check(d.has_value() && d->size() == temperature.size(), "scalar salinity against vector temperature");
  if (d) {
    check_close((*d)[2], 1.899288582e-9, 1e-6, "vector element matches scalar call");
  }

  auto sc = seagas::transport::schmidt_number(eos80, 35.0, temperature, Gas::CO2);
  check(sc.has_value() && sc->size() == temperature.size(), "CO2 Schmidt number over a vector");
}

} // namespace

int main() {
  test_arrhenius_values();
  test_co2_uses_schmidt_correlation();
  test_co2_schmidt_number();
  test_schmidt_definition();
  test_trends();
  test_positive_and_salinity_monotonic();
  test_n2o_unsupported();
  test_array_inputs();
  return seagas::test::finish();
}
