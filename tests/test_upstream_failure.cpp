#include "seagas/io/property_table_generator.hpp"
#include "seagas/seawater/seawater_interface.hpp"
#include "seagas/solubility/solubility.hpp"
#include "seagas/transport/diffusivity.hpp"
#include "seagas/transport/viscosity.hpp"
#include "test_utils.hpp"
#include <vector>

using seagas::core::PropertyError;
using seagas::gas::Gas;
using seagas::seawater::SeawaterError;
using seagas::test::check;

namespace {

// Provider whose every call fails, counting how often it is consulted
class FailingSeawater final : public seagas::seawater::SeawaterInterface {
public:
  mutable int calls = 0;

  [[nodiscard]] auto name() const noexcept -> std::string_view override { return "failing"; }

  [[nodiscard]] auto conservative_temperature(double, double) const -> std::expected<double, SeawaterError> override {
    return fail();
  }
  [[nodiscard]] auto density(double, double, double) const -> std::expected<double, SeawaterError> override {
    return fail();
  }
  [[nodiscard]] auto practical_salinity_from_absolute(double, double, double, double) const
      -> std::expected<double, SeawaterError> override {
    return fail();
  }
  [[nodiscard]] auto potential_temperature_from_conservative(double, double) const
      -> std::expected<double, SeawaterError> override {
    return fail();
  }

private:
  auto fail() const -> std::expected<double, SeawaterError> {
    ++calls;
    return std::unexpected(SeawaterError("state out of range"));
  }
};

const std::string expected_message = "Seawater Error: state out of range";

void check_upstream(const PropertyError& error, std::string_view what) {
  check(error.kind() == PropertyError::Kind::UpstreamFailure, std::format("{}: kind is UpstreamFailure", what));
  check(error.message() == expected_message, std::format("{}: provider message passed through", what));
}

void test_viscosity_path() {
  FailingSeawater provider;
  auto nu = seagas::transport::kinematic_viscosity(provider, 35.0, 20.0);
  check(!nu, "viscosity fails with a failing provider");
  if (!nu) {
    check_upstream(nu.error(), "viscosity");
  }

  auto co2 = seagas::transport::diffusion_coefficient(provider, 35.0, 20.0, Gas::CO2);
  check(!co2, "CO2 diffusivity needs the provider");
  if (!co2) {
    check_upstream(co2.error(), "CO2 diffusivity");
  }

  auto sc = seagas::transport::schmidt_number(provider, 35.0, 20.0, Gas::O2);
  check(!sc, "O2 Schmidt number needs the provider");
  if (!sc) {
    check_upstream(sc.error(), "O2 Schmidt number");
  }
}

void test_provider_not_consulted() {
  FailingSeawater provider;

  auto d = seagas::transport::diffusion_coefficient(provider, 35.0, 20.0, Gas::O2);
  check(d.has_value(), "Arrhenius diffusivity does not need the provider");

  auto sc = seagas::transport::schmidt_number(provider, 35.0, 20.0, Gas::CO2);
  check(sc.has_value(), "CO2 Schmidt number does not need the provider");

  check(provider.calls == 0, "provider never called");
}

void test_absolute_path() {
  FailingSeawater provider;
  auto c = seagas::solubility::solubility_from_absolute(provider, 35.0, 20.0, 0.0, 0.0, 0.0, Gas::O2);
  check(!c, "solubility from SA/CT fails with a failing provider");
  if (!c) {
    check_upstream(c.error(), "solubility from SA/CT");
  }
}

void test_array_aborts_on_first_element() {
  FailingSeawater provider;
  std::vector<double> temperature{0.0, 10.0, 20.0, 30.0};
  auto nu = seagas::transport::kinematic_viscosity(provider, 35.0, temperature);
  check(!nu, "array viscosity fails");
  if (!nu) {
    check_upstream(nu.error(), "array viscosity");
  }
  check(provider.calls == 1, "array evaluation stops after the first failure");
}

void test_table_generation() {
  FailingSeawater provider;
  seagas::io::TableConfig config;
  config.gases = {Gas::O2};
  config.quantities = {seagas::io::Quantity::Solubility, seagas::io::Quantity::Viscosity};
  config.salinity = {30.0, 35.0, 2};
  config.temperature = {0.0, 10.0, 3};

  seagas::io::PropertyTableGenerator generator(provider, config);
  auto result = generator.generate();
  check(!result, "table generation fails when viscosity needs a failing provider");
  if (!result) {
    check_upstream(result.error(), "table generation");
  }
}

} // namespace

int main() {
  test_viscosity_path();
  test_provider_not_consulted();
  test_absolute_path();
  test_array_aborts_on_first_element();
  test_table_generation();
  return seagas::test::finish();
}
