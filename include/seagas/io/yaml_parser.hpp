#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include <algorithm>
#include <cctype>
#include <concepts>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace seagas::io {

class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node,
                                   std::string_view key) const -> std::expected<T, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key,
                                  const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<EnumType, core::ConfigurationError>;

  template <typename EnumType>
  [[nodiscard]] auto extract_enum_list(const YAML::Node& node, std::string_view key,
                                       const std::unordered_map<std::string, EnumType>& mapping) const
      -> std::expected<std::vector<EnumType>, core::ConfigurationError>;

  [[nodiscard]] auto parse_table_config(const YAML::Node& node) const
      -> std::expected<TableConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_axis_config(const YAML::Node& node, std::string_view axis_name,
                                       GridAxisConfig defaults) const
      -> std::expected<GridAxisConfig, core::ConfigurationError>;

  [[nodiscard]] auto parse_seawater_config(const YAML::Node& node) const
      -> std::expected<SeawaterConfig, core::ConfigurationError>;

  [[nodiscard]] auto
  parse_output_config(const YAML::Node& node) const -> std::expected<OutputConfig, core::ConfigurationError>;

  // Cross-field checks: every requested (gas, quantity) pair must be computable
  [[nodiscard]] auto validate_table(const TableConfig& table) const -> std::expected<void, core::ConfigurationError>;

public:
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  // Parse from an in-memory document instead of a file
  [[nodiscard]] static auto from_string(std::string_view content) -> std::expected<YamlParser, core::FileError>;

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  [[nodiscard]] auto parse() const -> std::expected<Configuration, core::ConfigurationError>;
};

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node,
                               std::string_view key) const -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(std::format("Required field '{}' is missing", key)));
    }
    return node[std::string(key)].as<T>();
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(std::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename EnumType>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key,
                              const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<EnumType, core::ConfigurationError> {
  auto str_result = extract_value<std::string>(node, key);
  if (!str_result) {
    return std::unexpected(str_result.error());
  }

  auto str_value = str_result.value();
  std::ranges::transform(str_value, str_value.begin(), ::tolower);

  auto it = mapping.find(str_value);
  if (it == mapping.end()) {
    std::string valid_options;
    for (const auto& [option, _] : mapping) {
      valid_options += option + ", ";
    }
    valid_options = valid_options.substr(0, valid_options.length() - constants::string_processing::option_separator_length);

    return std::unexpected(core::ConfigurationError(
        std::format("Invalid value '{}' for field '{}'. Valid options: {}", str_value, key, valid_options)));
  }

  return it->second;
}

template <typename EnumType>
auto YamlParser::extract_enum_list(const YAML::Node& node, std::string_view key,
                                   const std::unordered_map<std::string, EnumType>& mapping) const
    -> std::expected<std::vector<EnumType>, core::ConfigurationError> {
  auto list_result = extract_value<std::vector<std::string>>(node, key);
  if (!list_result) {
    return std::unexpected(list_result.error());
  }
  if (list_result.value().empty()) {
    return std::unexpected(core::ValidationError(key, "list must not be empty"));
  }

  std::vector<EnumType> values;
  for (auto item : list_result.value()) {
    std::ranges::transform(item, item.begin(), ::tolower);
    auto it = mapping.find(item);
    if (it == mapping.end()) {
      return std::unexpected(core::ValidationError(key, std::format("unknown entry '{}'", item)));
    }
    if (std::ranges::find(values, it->second) == values.end()) {
      values.push_back(it->second);
    }
  }
  return values;
}

// Enum mappings
namespace enum_mappings {

inline const std::unordered_map<std::string, Quantity> quantities = {
    {"solubility", Quantity::Solubility},
    {"diffusivity", Quantity::Diffusivity},
    {"diffusion_coefficient", Quantity::Diffusivity},
    {"schmidt", Quantity::SchmidtNumber},
    {"schmidt_number", Quantity::SchmidtNumber},
    {"viscosity", Quantity::Viscosity},
    {"kinematic_viscosity", Quantity::Viscosity}};

inline const std::unordered_map<std::string, SeawaterConfig::Provider> seawater_providers = {
    {"eos80", SeawaterConfig::Provider::EOS80},
    {"eos-80", SeawaterConfig::Provider::EOS80},
    {"unesco", SeawaterConfig::Provider::EOS80},
    {"teos10", SeawaterConfig::Provider::TEOS10},
    {"teos-10", SeawaterConfig::Provider::TEOS10},
    {"gsw", SeawaterConfig::Provider::TEOS10}};

inline const std::unordered_map<std::string, OutputFormat> output_formats = {
    {"hdf5", OutputFormat::HDF5},
    {"h5", OutputFormat::HDF5},
    {"csv", OutputFormat::CSV}};

} // namespace enum_mappings

} // namespace seagas::io
