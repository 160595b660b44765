#include "seagas/io/config_manager.hpp"
#include <format>

namespace seagas::io {

auto ConfigurationManager::resolve_config_path(std::string_view config_file) const
    -> std::expected<std::filesystem::path, core::FileError> {
  std::filesystem::path path_candidate(config_file);

  if (!std::filesystem::exists(path_candidate)) {
    return std::unexpected(core::FileError{"could not locate config file", std::string(config_file)});
  }
  if (!std::filesystem::is_regular_file(path_candidate)) {
    return std::unexpected(core::FileError{"config path is not a regular file", std::string(config_file)});
  }
  return std::filesystem::absolute(path_candidate);
}

auto ConfigurationManager::validate_case_name(std::string_view case_name)
    -> std::expected<void, core::ValidationError> {
  if (case_name.empty()) {
    return std::unexpected(core::ValidationError("case_name", "must not be empty"));
  }
  if (case_name == "." || case_name == "..") {
    return std::unexpected(core::ValidationError("case_name", std::format("'{}' is not a file name", case_name)));
  }
  if (case_name.find_first_of("/\\") != std::string_view::npos) {
    return std::unexpected(
        core::ValidationError("case_name", std::format("'{}' must not contain path separators", case_name)));
  }
  return {};
}

auto ConfigurationManager::load(std::string_view config_file, const std::optional<std::string>& case_name)
    -> std::expected<Configuration, core::ConfigurationError> {

  auto path_result = resolve_config_path(config_file);
  if (!path_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to resolve config path: {}", path_result.error().message())));
  }

  config_file_path_ = path_result.value();

  parser_ = std::make_unique<YamlParser>(config_file_path_.string());

  auto load_result = parser_->load();
  if (!load_result) {
    return std::unexpected(
        core::ConfigurationError(std::format("Failed to load YAML file: {}", load_result.error().message())));
  }

  auto parse_result = parser_->parse();
  if (!parse_result) {
    return std::unexpected(parse_result.error());
  }
  auto config = std::move(parse_result.value());

  if (case_name) {
    if (auto valid = validate_case_name(*case_name); !valid) {
      return std::unexpected(valid.error());
    }
    config.output.case_name = *case_name;
  } else if (auto valid = validate_case_name(config.output.case_name); !valid) {
    return std::unexpected(core::ValidationError("output.case_name", valid.error().message()));
  }

  current_config_ = std::move(config);

  return *current_config_;
}

} // namespace seagas::io
