#pragma once

#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../gas/gas.hpp"
#include "../seawater/seawater_interface.hpp"
#include "config_types.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace seagas::io {

class PropertyTableGenerator {
public:
  struct Table {
    std::optional<gas::Gas> gas; // empty for gas-independent quantities (viscosity)
    Quantity quantity;
    std::string units;
    core::Matrix<double> values; // [n_salinity x n_temperature]
  };

  struct Result {
    std::vector<double> salinities;
    std::vector<double> temperatures;
    std::vector<Table> tables;
  };

  PropertyTableGenerator(const seawater::SeawaterInterface& seawater, const TableConfig& config);

  // Evaluate every requested (gas, quantity) pair on the salinity x temperature grid
  [[nodiscard]] auto generate() const -> std::expected<Result, core::PropertyError>;

  [[nodiscard]] static auto quantity_units(Quantity quantity, gas::Gas gas)
      -> std::expected<std::string, core::PropertyError>;

private:
  const seawater::SeawaterInterface& seawater_;
  const TableConfig& config_;

  [[nodiscard]] auto evaluate(const core::Field& salinity, const core::Field& temperature, Quantity quantity,
                              gas::Gas gas) const -> std::expected<core::Field, core::PropertyError>;
};

} // namespace seagas::io
