#pragma once
#include "../io/config_types.hpp"
#include "../seawater/seawater_interface.hpp"
#include "application_types.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace seagas::core {

class ConfigurationLoader {
public:
  struct LoadResult {
    io::Configuration config;
    std::unique_ptr<seawater::SeawaterInterface> seawater;
  };

  // Load configuration and create the seawater provider
  [[nodiscard]] auto load_configuration(const std::string& config_file,
                                        const std::optional<std::string>& case_name = std::nullopt)
    -> std::expected<LoadResult, ApplicationError>;

  auto display_configuration_info(const io::Configuration& config,
                                  const seawater::SeawaterInterface& seawater) const -> void;

private:
  [[nodiscard]] auto load_config_file(const std::string& config_file, const std::optional<std::string>& case_name)
    -> std::expected<io::Configuration, ApplicationError>;

  [[nodiscard]] auto create_provider(const io::SeawaterConfig& seawater_config)
    -> std::expected<std::unique_ptr<seawater::SeawaterInterface>, ApplicationError>;

  auto display_table_info(const io::Configuration& config) const -> void;

  auto display_grid_info(const io::Configuration& config) const -> void;
};

} // namespace seagas::core
