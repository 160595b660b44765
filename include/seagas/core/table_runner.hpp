#pragma once
#include "../io/config_types.hpp"
#include "../io/property_table_generator.hpp"
#include "../seawater/seawater_interface.hpp"
#include "application_types.hpp"
#include <expected>

namespace seagas::core {

class TableRunner {
public:
  // Generate every configured table on the salinity x temperature grid
  [[nodiscard]] auto run_generation(
    const seawater::SeawaterInterface& seawater,
    const io::Configuration& config,
    PerformanceMetrics& metrics)
    -> std::expected<io::PropertyTableGenerator::Result, ApplicationError>;

  // Per-table value ranges
  auto display_table_summary(const io::PropertyTableGenerator::Result& result) const -> void;
};

} // namespace seagas::core
