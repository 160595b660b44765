#include "seagas/core/application_runner.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/io/output/hdf5_writer.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

namespace seagas::core {

ApplicationRunner::ApplicationRunner()
  : config_loader_(std::make_unique<ConfigurationLoader>())
  , output_manager_(std::make_unique<OutputManager>())
  , table_runner_(std::make_unique<TableRunner>()) {
}

ApplicationRunner::~ApplicationRunner() = default;

auto ApplicationRunner::run(int argc, char* argv[]) -> ApplicationResult {
  auto start_time = std::chrono::high_resolution_clock::now();
  PerformanceMetrics metrics;

  try {
    auto args_result = parse_command_line(argc, argv);
    if (!args_result) {
      display_usage(argc > 0 ? argv[constants::indexing::first] : "seagas");
      return handle_error(args_result.error());
    }
    auto args = args_result.value();

    if (args.help_requested) {
      display_usage(argv[constants::indexing::first]);
      return {true, constants::indexing::first, "Help displayed"};
    }

    display_header();

    auto config_result = config_loader_->load_configuration(args.config_file, args.case_name);
    if (!config_result) {
      return handle_error(config_result.error());
    }
    auto [config, seawater] = std::move(config_result.value());

    const std::string& case_name = config.output.case_name;

    if (auto output_init = output_manager_->initialize_output_system(config); !output_init) {
      return handle_error(output_init.error());
    }
    output_manager_->display_planned_outputs(case_name);

    auto generation_result = table_runner_->run_generation(*seawater, config, metrics);
    if (!generation_result) {
      return handle_error(generation_result.error());
    }
    auto tables = std::move(generation_result.value());

    auto output_result = output_manager_->write_tables(tables, seawater->name(), case_name, metrics);
    if (!output_result) {
      return handle_error(output_result.error());
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    table_runner_->display_table_summary(tables);
    display_performance_summary(metrics);
    display_completion_message();

    cleanup();

    return {true, constants::indexing::first, "Success"};

  } catch (const std::exception& e) {
    return handle_error(ApplicationError{"Unexpected error: " + std::string(e.what()), constants::indexing::second});
  }
}

auto ApplicationRunner::parse_command_line(int argc, char* argv[])
  -> std::expected<CommandLineArgs, ApplicationError> {

  constexpr int min_required_args = 2;
  constexpr int max_accepted_args = 3;

  if (argc < min_required_args) {
    return std::unexpected(ApplicationError{
      "Insufficient arguments provided",
      constants::indexing::second
    });
  }
  if (argc > max_accepted_args) {
    return std::unexpected(ApplicationError{
      "Too many arguments provided",
      constants::indexing::second
    });
  }

  CommandLineArgs args;
  const std::string_view first_arg = argv[constants::indexing::second];
  if (first_arg == "-h" || first_arg == "--help") {
    args.help_requested = true;
    return args;
  }

  args.config_file = first_arg;
  if (argc == max_accepted_args) {
    args.case_name = argv[constants::indexing::third];
  }

  return args;
}

auto ApplicationRunner::display_usage(const std::string& program_name) const -> void {
  std::cerr << "Usage: " << program_name << " <config_file.yaml> [case_name]\n"
            << "\n"
            << "Generates solubility, diffusivity, Schmidt number and viscosity tables\n"
            << "for dissolved gases in seawater on a salinity x temperature grid.\n";
}

auto ApplicationRunner::display_header() const -> void {
  std::cout << "=== SEAGAS Dissolved Gas Property Tables ===" << std::endl;
}

auto ApplicationRunner::display_performance_summary(const PerformanceMetrics& metrics) const -> void {
  std::cout << "\n=== PERFORMANCE SUMMARY ===" << std::endl;
  std::cout << "Total runtime: " << metrics.total_time.count() << " ms" << std::endl;
  std::cout << "  Generation: " << metrics.generation_time.count() << " ms" << std::endl;
  std::cout << "  Output: " << metrics.output_time.count() << " ms" << std::endl;
}

auto ApplicationRunner::display_completion_message() const -> void {
  std::cout << "\n=== TABLES COMPLETED SUCCESSFULLY ===" << std::endl;
  std::cout << "\nPost-processing recommendations:" << std::endl;
  std::cout << "  • Open .h5 files with HDFView or Python (h5py, pandas)" << std::endl;
}

auto ApplicationRunner::cleanup() -> void {
  io::output::hdf5::finalize();
}

auto ApplicationRunner::handle_error(const ApplicationError& error) -> ApplicationResult {
  std::cerr << constants::string_processing::colors::red << "Error: " << error.message
            << constants::string_processing::colors::reset << std::endl;
  cleanup();
  return {false, error.exit_code, error.message};
}

} // namespace seagas::core
