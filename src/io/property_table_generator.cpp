#include "seagas/io/property_table_generator.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/core/expected_utils.hpp"
#include "seagas/solubility/solubility.hpp"
#include "seagas/transport/diffusivity.hpp"
#include "seagas/transport/viscosity.hpp"
#include <format>
#include <iostream>

namespace seagas::io {

PropertyTableGenerator::PropertyTableGenerator(const seawater::SeawaterInterface& seawater,
                                               const TableConfig& config)
    : seawater_(seawater), config_(config) {}

auto PropertyTableGenerator::quantity_units(Quantity quantity, gas::Gas gas)
    -> std::expected<std::string, core::PropertyError> {
  switch (quantity) {
  case Quantity::Solubility: {
    std::string_view units;
    SEAGAS_TRY_ASSIGN(units, solubility::solubility_units(gas));
    return std::string(units);
  }
  case Quantity::Diffusivity:
  case Quantity::Viscosity:
    return "m^2/s";
  case Quantity::SchmidtNumber:
    return "1";
  }
  return std::unexpected(core::PropertyError(core::PropertyError::Kind::UnsupportedGas, "Unknown quantity"));
}

auto PropertyTableGenerator::evaluate(const core::Field& salinity, const core::Field& temperature, Quantity quantity,
                                      gas::Gas gas) const -> std::expected<core::Field, core::PropertyError> {
  switch (quantity) {
  case Quantity::Solubility:
    return solubility::solubility(salinity, temperature, gas);
  case Quantity::Diffusivity:
    return transport::diffusion_coefficient(seawater_, salinity, temperature, gas);
  case Quantity::SchmidtNumber:
    return transport::schmidt_number(seawater_, salinity, temperature, gas);
  case Quantity::Viscosity:
    return transport::kinematic_viscosity(seawater_, salinity, temperature);
  }
  return std::unexpected(core::PropertyError(core::PropertyError::Kind::UnsupportedGas, "Unknown quantity"));
}

auto PropertyTableGenerator::generate() const -> std::expected<Result, core::PropertyError> {
  Result result;
  result.salinities = config_.salinity.values();
  result.temperatures = config_.temperature.values();

  const auto n_sal = static_cast<Eigen::Index>(result.salinities.size());
  const auto n_temp = static_cast<Eigen::Index>(result.temperatures.size());

  // Column of salinities against a row of temperatures broadcasts to the full grid
  core::Field salinity(n_sal, 1);
  for (Eigen::Index i = 0; i < n_sal; ++i) {
    salinity(i, 0) = result.salinities[static_cast<std::size_t>(i)];
  }
  core::Field temperature(1, n_temp);
  for (Eigen::Index j = 0; j < n_temp; ++j) {
    temperature(0, j) = result.temperatures[static_cast<std::size_t>(j)];
  }

  std::cout << "\n=== PROPERTY TABLE GENERATION ===" << std::endl;
  std::cout << std::format("Grid: {} salinities [{}, {}] x {} temperatures [{}, {}] °C", n_sal,
                           result.salinities.front(), result.salinities.back(), n_temp, result.temperatures.front(),
                           result.temperatures.back())
            << std::endl;
  std::cout << "Seawater provider: " << seawater_.name() << std::endl;

  for (const auto quantity : config_.quantities) {
    if (quantity == Quantity::Viscosity) {
      std::cout << "  " << quantity_name(quantity) << std::endl;
      core::Field values;
      SEAGAS_TRY_ASSIGN(values, transport::kinematic_viscosity(seawater_, salinity, temperature));
      result.tables.push_back(Table{std::nullopt, quantity, "m^2/s", core::Matrix<double>(values)});
      continue;
    }

    for (const auto gas : config_.gases) {
      std::cout << "  " << quantity_name(quantity) << " / " << gas::symbol(gas) << std::endl;

      std::string units;
      SEAGAS_TRY_ASSIGN(units, quantity_units(quantity, gas));

      core::Field values;
      SEAGAS_TRY_ASSIGN(values, evaluate(salinity, temperature, quantity, gas));
      result.tables.push_back(Table{gas, quantity, std::move(units), core::Matrix<double>(values)});
    }
  }

  std::cout << "=== " << result.tables.size() << " TABLES GENERATED ===" << std::endl;
  return result;
}

} // namespace seagas::io
