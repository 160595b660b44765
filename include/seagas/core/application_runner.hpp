#pragma once
#include "application_types.hpp"
#include "configuration_loader.hpp"
#include "output_manager.hpp"
#include "table_runner.hpp"
#include <expected>
#include <memory>

namespace seagas::core {

class ApplicationRunner {
public:
  ApplicationRunner();
  ~ApplicationRunner();

  // Main application entry point
  [[nodiscard]] auto run(int argc, char* argv[]) -> ApplicationResult;

private:
  std::unique_ptr<ConfigurationLoader> config_loader_;
  std::unique_ptr<OutputManager> output_manager_;
  std::unique_ptr<TableRunner> table_runner_;

  [[nodiscard]] auto parse_command_line(int argc, char* argv[])
    -> std::expected<CommandLineArgs, ApplicationError>;

  auto display_usage(const std::string& program_name) const -> void;

  auto display_header() const -> void;

  auto display_performance_summary(const PerformanceMetrics& metrics) const -> void;

  auto display_completion_message() const -> void;

  auto cleanup() -> void;

  // Convert ApplicationError to ApplicationResult
  auto handle_error(const ApplicationError& error) -> ApplicationResult;
};

} // namespace seagas::core
