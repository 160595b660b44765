#include "seagas/core/constants.hpp"
#include "seagas/seawater/eos80_seawater.hpp"
#include "seagas/solubility/solubility.hpp"
#include "seagas/solubility/solubility_coefficients.hpp"
#include "test_utils.hpp"
#include <vector>

using seagas::gas::Gas;
using seagas::test::check;
using seagas::test::check_close;

namespace {

struct Reference {
  Gas gas;
  double at_35_20;
  double at_0_0;
};

// Published check values re-evaluated in double precision
const std::vector<Reference> references = {
    {Gas::O2, 225.5170784, 457.0057297},     {Gas::He, 0.001661729408, 0.002184917399},
    {Gas::Ne, 6.827094074, 10.08374886},     {Gas::Ar, 11.07454808, 22.30086845},
    {Gas::Kr, 0.002439951924, 0.005553295228}, {Gas::N2, 419.7732437, 830.4530136},
    {Gas::N2O, 0.0232928283, 0.05909397529}, {Gas::CO2, 0.03156717358, 0.07681282718},
};

void test_reference_values() {
  for (const auto& ref : references) {
    const auto name = seagas::gas::symbol(ref.gas);
    auto warm = seagas::solubility::solubility(35.0, 20.0, ref.gas);
    auto cold = seagas::solubility::solubility(0.0, 0.0, ref.gas);
    check(warm.has_value() && cold.has_value(), std::format("{} solubility evaluates", name));
    if (warm && cold) {
      check_close(*warm, ref.at_35_20, 1e-6, std::format("{} at SP=35, pt=20", name));
      check_close(*cold, ref.at_0_0, 1e-6, std::format("{} at SP=0, pt=0", name));
    }
  }

  // Garcia & Gordon check value
  auto o2 = seagas::solubility::solubility(35.0, 20.0, Gas::O2);
  check(o2 && std::abs(*o2 - 225.0) < 1.0, "O2 near 225 umol/kg at SP=35, pt=20");

  auto he = seagas::solubility::solubility(35.0, 10.0, Gas::He);
  check(he.has_value(), "He at pt=10 evaluates");
  if (he) {
    check_close(*he, 0.001701612963, 1e-8, "He at SP=35, pt=10");
    // Weiss (1971) Table 3: 3.82e-5 mL/kg at S = 35, t = 10 degC, i.e. 1.7021e-3 umol/kg
    const double weiss_table = 3.82e-5 * seagas::constants::conversion::helium_ml_to_umol;
    check_close(*he, weiss_table, 1e-3, "He within 0.1% of the Weiss (1971) tabulated value");
  }
}

void test_positive_and_monotonic() {
  for (auto gas : seagas::gas::all_gases()) {
    if (!seagas::solubility::is_solubility_supported(gas)) {
      continue;
    }
    const auto name = seagas::gas::symbol(gas);
    bool positive = true;
    bool cooler_holds_more = true;
    bool fresher_holds_more = true;
    for (double sp = 0.0; sp <= 40.0; sp += 5.0) {
      for (double pt = -2.0; pt <= 40.0; pt += 2.0) {
        const double c = *seagas::solubility::solubility(sp, pt, gas);
        positive = positive && c > 0.0;
        if (pt + 2.0 <= 40.0) {
          cooler_holds_more = cooler_holds_more && c > *seagas::solubility::solubility(sp, pt + 2.0, gas);
        }
        if (sp + 5.0 <= 40.0) {
          fresher_holds_more = fresher_holds_more && c > *seagas::solubility::solubility(sp + 5.0, pt, gas);
        }
      }
    }
    check(positive, std::format("{} solubility positive over the oceanic range", name));
    check(cooler_holds_more, std::format("{} solubility decreases with temperature", name));
    check(fresher_holds_more, std::format("{} solubility decreases with salinity", name));
  }
}

void test_molar_volume_conversion() {
  namespace coeff = seagas::solubility::coefficients;
  check(coeff::helium.unit_factor == seagas::constants::conversion::helium_ml_to_umol, "He mL/kg -> umol/kg factor");
  check(coeff::krypton.unit_factor == seagas::constants::conversion::krypton_ml_to_umol, "Kr mL/kg -> umol/kg factor");
  check(coeff::nitrous_oxide.unit_factor == 1.0 && coeff::carbon_dioxide.unit_factor == 1.0,
        "N2O and CO2 stay in mol/(kg atm)");
}

void test_unsupported_gases() {
  for (auto gas : {Gas::Xe, Gas::CH4, Gas::H2}) {
    const auto name = seagas::gas::symbol(gas);
    check(!seagas::solubility::is_solubility_supported(gas), std::format("{} flagged unsupported", name));

    auto value = seagas::solubility::solubility(35.0, 20.0, gas);
    check(!value && value.error().kind() == seagas::core::PropertyError::Kind::UnsupportedGas,
          std::format("{} scalar solubility reports UnsupportedGas", name));

    auto units = seagas::solubility::solubility_units(gas);
    check(!units, std::format("{} has no solubility units", name));

    // Even an empty array reports the unsupported gas
    auto empty = seagas::solubility::solubility(std::vector<double>{}, 20.0, gas);
    check(!empty && empty.error().kind() == seagas::core::PropertyError::Kind::UnsupportedGas,
          std::format("{} array solubility reports UnsupportedGas", name));
  }
}

void test_units() {
  check(*seagas::solubility::solubility_units(Gas::O2) == "umol/kg", "O2 in umol/kg");
  check(*seagas::solubility::solubility_units(Gas::He) == "umol/kg", "He in umol/kg");
  check(*seagas::solubility::solubility_units(Gas::Ne) == "nmol/kg", "Ne in nmol/kg");
  check(*seagas::solubility::solubility_units(Gas::CO2) == "mol/(kg atm)", "CO2 in mol/(kg atm)");
  check(*seagas::solubility::solubility_units(Gas::N2O) == "mol/(kg atm)", "N2O in mol/(kg atm)");
}

void test_array_inputs() {
  std::vector<double> salinity{0.0, 20.0, 35.0};
  auto values = seagas::solubility::solubility(salinity, 20.0, Gas::Ar);
  check(values.has_value() && values->size() == 3, "vector salinity keeps its length");
  if (values) {
    check_close((*values)[2], 11.07454808, 1e-6, "vector element matches scalar call");
  }

  seagas::core::Field sp(2, 1);
  sp << 0.0, 35.0;
  seagas::core::Field pt(1, 3);
  pt << 0.0, 10.0, 20.0;
  auto grid = seagas::solubility::solubility(sp, pt, Gas::N2);
  check(grid.has_value() && grid->rows() == 2 && grid->cols() == 3, "column x row broadcasts to a 2x3 grid");
  if (grid) {
    check_close((*grid)(0, 0), 830.4530136, 1e-6, "grid (SP=0, pt=0)");
    check_close((*grid)(1, 2), 419.7732437, 1e-6, "grid (SP=35, pt=20)");
  }
}

void test_from_absolute() {
  seagas::seawater::Eos80Seawater eos80;
  const double sa = 35.0 * seagas::constants::scales::reference_composition_ratio;

  auto value = seagas::solubility::solubility_from_absolute(eos80, sa, 20.0, 0.0, -30.0, 45.0, Gas::O2);
  check(value.has_value(), "solubility from SA/CT evaluates");
  if (value) {
    check_close(*value, 225.5170784, 1e-9, "SA/CT path matches SP/pt path under EOS-80");
  }

  auto bad_latitude = seagas::solubility::solubility_from_absolute(eos80, sa, 20.0, 0.0, 0.0, 95.0, Gas::O2);
  check(!bad_latitude && bad_latitude.error().kind() == seagas::core::PropertyError::Kind::UpstreamFailure,
        "provider rejection surfaces as UpstreamFailure");

  auto unsupported = seagas::solubility::solubility_from_absolute(eos80, sa, 20.0, 0.0, 0.0, 95.0, Gas::Xe);
  check(!unsupported && unsupported.error().kind() == seagas::core::PropertyError::Kind::UnsupportedGas,
        "unsupported gas is reported before the provider is consulted");
}

} // namespace

int main() {
  test_reference_values();
  test_positive_and_monotonic();
  test_molar_volume_conversion();
  test_unsupported_gases();
  test_units();
  test_array_inputs();
  test_from_absolute();
  return seagas::test::finish();
}
