#include "seagas/core/configuration_loader.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/io/config_manager.hpp"
#include <format>
#include <iomanip>
#include <iostream>

namespace seagas::core {

auto ConfigurationLoader::load_configuration(const std::string& config_file,
                                             const std::optional<std::string>& case_name)
  -> std::expected<LoadResult, ApplicationError> {

  auto config_result = load_config_file(config_file, case_name);
  if (!config_result) {
    return std::unexpected(config_result.error());
  }
  auto config = std::move(config_result.value());

  std::cout << "✓ Configuration loaded successfully" << std::endl;

  auto provider_result = create_provider(config.seawater);
  if (!provider_result) {
    return std::unexpected(provider_result.error());
  }
  auto provider = std::move(provider_result.value());

  std::cout << "✓ Seawater provider created (" << provider->name() << ")" << std::endl;

  display_configuration_info(config, *provider);

  return LoadResult{std::move(config), std::move(provider)};
}

auto ConfigurationLoader::display_configuration_info(const io::Configuration& config,
                                                     const seawater::SeawaterInterface& seawater) const -> void {
  std::cout << "\nSeawater equation of state: " << seawater.name() << std::endl;
  display_table_info(config);
  display_grid_info(config);
}

auto ConfigurationLoader::load_config_file(const std::string& config_file,
                                           const std::optional<std::string>& case_name)
  -> std::expected<io::Configuration, ApplicationError> {

  io::ConfigurationManager config_manager;
  auto config_result = config_manager.load(config_file, case_name);

  if (!config_result) {
    return std::unexpected(ApplicationError{
      "Failed to load config: " + config_result.error().message(),
      constants::indexing::second
    });
  }

  return std::move(config_result.value());
}

auto ConfigurationLoader::create_provider(const io::SeawaterConfig& seawater_config)
  -> std::expected<std::unique_ptr<seawater::SeawaterInterface>, ApplicationError> {

  auto provider_result = seawater::create_seawater(seawater_config);
  if (!provider_result) {
    return std::unexpected(ApplicationError{
      "Failed to create seawater provider: " + provider_result.error().message(),
      constants::indexing::second
    });
  }

  return std::move(provider_result.value());
}

auto ConfigurationLoader::display_table_info(const io::Configuration& config) const -> void {
  std::string gases;
  for (const auto gas : config.table.gases) {
    if (!gases.empty()) gases += ' ';
    gases += gas::symbol(gas);
  }
  std::string quantities;
  for (const auto quantity : config.table.quantities) {
    if (!quantities.empty()) quantities += ' ';
    quantities += quantity_name(quantity);
  }

  std::cout << "\n" << constants::string_processing::colors::cyan
            << "┌─ TABLE SETUP ─────────────────────────────┐"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "│ Gases           : " << std::setw(23) << std::left << gases << " │" << std::endl;
  std::cout << "│ Quantities      : " << std::setw(23) << std::left << quantities << " │" << std::endl;
  std::cout << "│ Case name       : " << std::setw(23) << std::left << config.output.case_name << " │" << std::endl;
  std::cout << "│ Output directory: " << std::setw(23) << std::left << config.output.output_directory << " │"
            << std::endl;
  std::cout << constants::string_processing::colors::cyan
            << "└───────────────────────────────────────────┘"
            << constants::string_processing::colors::reset << std::endl;
}

auto ConfigurationLoader::display_grid_info(const io::Configuration& config) const -> void {
  const auto& sal = config.table.salinity;
  const auto& temp = config.table.temperature;

  std::cout << "\n" << constants::string_processing::colors::blue
            << "┌─ GRID ────────────────────────────────────┐"
            << constants::string_processing::colors::reset << std::endl;
  std::cout << "│ Salinity        : "
            << std::setw(23) << std::left << std::format("{:.2f} .. {:.2f} ({})", sal.min, sal.max, sal.points)
            << " │" << std::endl;
  std::cout << "│ Temperature (°C): "
            << std::setw(23) << std::left << std::format("{:.2f} .. {:.2f} ({})", temp.min, temp.max, temp.points)
            << " │" << std::endl;
  std::cout << constants::string_processing::colors::blue
            << "└───────────────────────────────────────────┘"
            << constants::string_processing::colors::reset << std::endl;
}

} // namespace seagas::core
