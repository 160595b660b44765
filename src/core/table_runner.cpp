#include "seagas/core/table_runner.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/io/output/output_types.hpp"
#include <chrono>
#include <format>
#include <iomanip>
#include <iostream>

namespace seagas::core {

auto TableRunner::run_generation(
  const seawater::SeawaterInterface& seawater,
  const io::Configuration& config,
  PerformanceMetrics& metrics)
  -> std::expected<io::PropertyTableGenerator::Result, ApplicationError> {

  auto start_time = std::chrono::high_resolution_clock::now();

  io::PropertyTableGenerator generator(seawater, config.table);
  auto result = generator.generate();

  auto end_time = std::chrono::high_resolution_clock::now();
  metrics.generation_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

  if (!result) {
    return std::unexpected(ApplicationError{
      "Table generation failed: " + result.error().message(),
      constants::indexing::second
    });
  }

  std::cout << constants::string_processing::colors::green << "✓ Tables generated"
            << constants::string_processing::colors::reset
            << " (" << metrics.generation_time.count() << " ms)" << std::endl;

  return std::move(result.value());
}

auto TableRunner::display_table_summary(const io::PropertyTableGenerator::Result& result) const -> void {
  using constants::string_processing::wide_field_width;

  std::cout << "\n=== TABLE SUMMARY ===" << std::endl;
  std::cout << std::setw(20) << std::left << "table"
            << std::setw(wide_field_width) << std::right << "min"
            << std::setw(wide_field_width) << "max"
            << "  units" << std::endl;
  std::cout << std::string(constants::string_processing::separator_width + 24, '-') << std::endl;

  for (const auto& table : result.tables) {
    const auto& values = table.values.eigen();
    const bool empty = values.size() == 0;
    std::cout << std::setw(20) << std::left << io::output::table_path(table)
              << std::setw(wide_field_width) << std::right
              << (empty ? std::string("-") : std::format("{:.6g}", values.minCoeff()))
              << std::setw(wide_field_width)
              << (empty ? std::string("-") : std::format("{:.6g}", values.maxCoeff()))
              << "  " << table.units << std::endl;
  }
}

} // namespace seagas::core
