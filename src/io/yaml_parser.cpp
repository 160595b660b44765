#include "seagas/io/yaml_parser.hpp"
#include "seagas/core/constants.hpp"
#include "seagas/core/exceptions.hpp"
#include "seagas/solubility/solubility.hpp"
#include "seagas/transport/diffusivity.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace seagas::io {

auto YamlParser::from_string(std::string_view content) -> std::expected<YamlParser, core::FileError> {
  YamlParser parser("<string>");
  try {
    parser.root_ = YAML::Load(std::string(content));
    return parser;
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), parser.file_path_});
  }
}

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile& e) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{std::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(core::FileError{std::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<Configuration, core::ConfigurationError> {
  if (!root_ || root_.IsNull()) {
    return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
  }

  Configuration config;

  if (!root_["table"]) {
    return std::unexpected(core::ConfigurationError("Missing required 'table' section."));
  }
  auto table_result = parse_table_config(root_["table"]);
  if (!table_result) {
    return std::unexpected(table_result.error());
  }
  config.table = std::move(table_result.value());

  // seawater and output sections are optional
  if (root_["seawater"]) {
    auto seawater_result = parse_seawater_config(root_["seawater"]);
    if (!seawater_result) {
      return std::unexpected(seawater_result.error());
    }
    config.seawater = seawater_result.value();
  }

  if (root_["output"]) {
    auto output_result = parse_output_config(root_["output"]);
    if (!output_result) {
      return std::unexpected(output_result.error());
    }
    config.output = std::move(output_result.value());
  }

  return config;
}

auto YamlParser::parse_table_config(const YAML::Node& node) const
    -> std::expected<TableConfig, core::ConfigurationError> {

  TableConfig config;

  auto gas_names = extract_value<std::vector<std::string>>(node, "gases");
  if (!gas_names) {
    return std::unexpected(gas_names.error());
  }
  if (gas_names.value().empty()) {
    return std::unexpected(core::ValidationError("table.gases", "list must not be empty"));
  }
  for (const auto& name : gas_names.value()) {
    auto gas_result = gas::parse_gas(name);
    if (!gas_result) {
      return std::unexpected(core::ValidationError("table.gases", gas_result.error().message()));
    }
    if (std::ranges::find(config.gases, gas_result.value()) == config.gases.end()) {
      config.gases.push_back(gas_result.value());
    }
  }

  auto quantities = extract_enum_list(node, "quantities", enum_mappings::quantities);
  if (!quantities) {
    return std::unexpected(core::ConfigurationError(std::format("In 'table' section: {}", quantities.error().message())));
  }
  config.quantities = std::move(quantities.value());

  if (node["salinity"]) {
    auto axis = parse_axis_config(node["salinity"], "table.salinity", config.salinity);
    if (!axis) {
      return std::unexpected(axis.error());
    }
    config.salinity = axis.value();
  }

  if (node["temperature"]) {
    auto axis = parse_axis_config(node["temperature"], "table.temperature", config.temperature);
    if (!axis) {
      return std::unexpected(axis.error());
    }
    config.temperature = axis.value();
  }

  if (auto valid = validate_table(config); !valid) {
    return std::unexpected(valid.error());
  }

  return config;
}

auto YamlParser::parse_axis_config(const YAML::Node& node, std::string_view axis_name, GridAxisConfig defaults) const
    -> std::expected<GridAxisConfig, core::ConfigurationError> {

  GridAxisConfig axis = defaults;

  if (node["min"]) {
    auto result = extract_value<double>(node, "min");
    if (!result)
      return std::unexpected(result.error());
    axis.min = result.value();
  }
  if (node["max"]) {
    auto result = extract_value<double>(node, "max");
    if (!result)
      return std::unexpected(result.error());
    axis.max = result.value();
  }
  if (node["points"]) {
    auto result = extract_value<int>(node, "points");
    if (!result)
      return std::unexpected(result.error());
    axis.points = result.value();
  }

  if (!std::isfinite(axis.min) || !std::isfinite(axis.max)) {
    return std::unexpected(core::ValidationError(axis_name, "bounds must be finite"));
  }
  if (axis.points < 1) {
    return std::unexpected(core::ValidationError(axis_name, std::format("points must be >= 1, got {}", axis.points)));
  }
  if (axis.points == 1 && axis.min != axis.max) {
    return std::unexpected(core::ValidationError(axis_name, "a single point requires min == max"));
  }
  if (axis.points > 1 && axis.max <= axis.min) {
    return std::unexpected(
        core::ValidationError(axis_name, std::format("max ({}) must be greater than min ({})", axis.max, axis.min)));
  }

  return axis;
}

auto YamlParser::validate_table(const TableConfig& table) const -> std::expected<void, core::ConfigurationError> {
  for (const auto quantity : table.quantities) {
    for (const auto gas : table.gases) {
      switch (quantity) {
      case Quantity::Solubility:
        if (!solubility::is_solubility_supported(gas)) {
          return std::unexpected(core::ValidationError(
              "table.gases", std::format("gas '{}' has no solubility fit", gas::symbol(gas))));
        }
        break;
      case Quantity::Diffusivity:
      case Quantity::SchmidtNumber:
        if (auto supported = transport::require_diffusivity_support(gas); !supported) {
          return std::unexpected(core::ValidationError(
              "table.gases", std::format("gas '{}' has no diffusivity fit", gas::symbol(gas))));
        }
        break;
      case Quantity::Viscosity:
        break;
      }
    }
  }
  return {};
}

auto YamlParser::parse_seawater_config(const YAML::Node& node) const
    -> std::expected<SeawaterConfig, core::ConfigurationError> {

  SeawaterConfig config;
  if (node["provider"]) {
    auto provider = extract_enum(node, "provider", enum_mappings::seawater_providers);
    if (!provider) {
      return std::unexpected(core::ConfigurationError(std::format("In 'seawater' section: {}", provider.error().message())));
    }
    config.provider = provider.value();
  }
  return config;
}

auto YamlParser::parse_output_config(const YAML::Node& node) const
    -> std::expected<OutputConfig, core::ConfigurationError> {

  OutputConfig config;

  if (node["directory"]) {
    auto directory = extract_value<std::string>(node, "directory");
    if (!directory)
      return std::unexpected(directory.error());
    config.output_directory = directory.value();
  }

  if (node["case_name"]) {
    auto case_name = extract_value<std::string>(node, "case_name");
    if (!case_name)
      return std::unexpected(case_name.error());
    if (case_name.value().empty()) {
      return std::unexpected(core::ValidationError("output.case_name", "must not be empty"));
    }
    config.case_name = case_name.value();
  }

  if (node["formats"]) {
    auto formats = extract_enum_list(node, "formats", enum_mappings::output_formats);
    if (!formats) {
      return std::unexpected(core::ConfigurationError(std::format("In 'output' section: {}", formats.error().message())));
    }
    config.formats = std::move(formats.value());
  }

  return config;
}

} // namespace seagas::io
