#pragma once
#include "../io/config_types.hpp"
#include "../io/output/output_writer.hpp"
#include "../io/property_table_generator.hpp"
#include "application_types.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace seagas::core {

class OutputManager {
public:
  using ProgressCallback = std::function<void(double, const std::string&)>;

  // Initialize HDF5 and the configured format writers
  [[nodiscard]] auto initialize_output_system(const io::Configuration& config)
    -> std::expected<void, ApplicationError>;

  [[nodiscard]] auto write_tables(
    const io::PropertyTableGenerator::Result& result,
    std::string_view seawater_provider,
    const std::string& case_name,
    PerformanceMetrics& metrics)
    -> std::expected<std::vector<std::filesystem::path>, ApplicationError>;

  auto display_planned_outputs(const std::string& case_name) const -> void;

private:
  std::unique_ptr<io::output::OutputWriter> output_writer_;

  [[nodiscard]] auto initialize_hdf5() -> std::expected<void, ApplicationError>;

  auto create_progress_callback() -> ProgressCallback;
};

} // namespace seagas::core
