#pragma once
#include "../core/exceptions.hpp"
#include "config_types.hpp"
#include "yaml_parser.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace seagas::io {

// Resolves, loads and parses a table configuration file. A case name given on
// the command line replaces output.case_name after parsing.
class ConfigurationManager {
private:
  std::unique_ptr<YamlParser> parser_;
  std::optional<Configuration> current_config_;
  std::filesystem::path config_file_path_;

  [[nodiscard]] auto
  resolve_config_path(std::string_view config_file) const -> std::expected<std::filesystem::path, core::FileError>;

public:
  explicit ConfigurationManager() = default;

  [[nodiscard]] auto load(std::string_view config_file, const std::optional<std::string>& case_name = std::nullopt)
      -> std::expected<Configuration, core::ConfigurationError>;

  // Case names become output file stems
  [[nodiscard]] static auto validate_case_name(std::string_view case_name)
      -> std::expected<void, core::ValidationError>;

  [[nodiscard]] auto config_file_path() const noexcept -> const std::filesystem::path& { return config_file_path_; }
  [[nodiscard]] auto current() const noexcept -> const std::optional<Configuration>& { return current_config_; }
};
} // namespace seagas::io
