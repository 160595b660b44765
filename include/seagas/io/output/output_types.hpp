#pragma once
#include "../../core/constants.hpp"
#include "../../core/exceptions.hpp"
#include "../config_types.hpp"
#include "../property_table_generator.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace seagas::io::output {

using io::OutputFormat;

[[nodiscard]] constexpr auto format_name(OutputFormat format) noexcept -> std::string_view {
  switch (format) {
  case OutputFormat::HDF5:
    return "HDF5";
  case OutputFormat::CSV:
    return "CSV";
  }
  return "Unknown";
}

// Metadata container
struct TableMetadata {
  std::string seagas_version = constants::io::default_seagas_version;
  std::chrono::system_clock::time_point creation_time;
  std::string seawater_provider;
  std::string case_name;
};

// Complete output dataset
struct OutputDataset {
  TableMetadata metadata;
  PropertyTableGenerator::Result result;
};

// Dataset name of a table, "<gas>/<quantity>" or "<quantity>" for gas-independent tables
[[nodiscard]] inline auto table_path(const PropertyTableGenerator::Table& table) -> std::string {
  if (table.gas) {
    return std::format("{}/{}", gas::symbol(*table.gas), quantity_name(table.quantity));
  }
  return std::string(quantity_name(table.quantity));
}

// Progress callback for large outputs
using ProgressCallback = std::function<void(double progress, const std::string& stage)>;

// Output error types
class OutputError : public core::SeagasException {
public:
  explicit OutputError(std::string_view message, std::source_location location = std::source_location::current())
      : SeagasException(std::format("Output Error: {}", message), location) {}
};

class FileWriteError : public OutputError {
private:
  std::filesystem::path file_path_;

public:
  explicit FileWriteError(const std::filesystem::path& path, std::string_view message,
                          std::source_location location = std::source_location::current())
      : OutputError(std::format("File '{}': {}", path.string(), message), location), file_path_(path) {}

  [[nodiscard]] auto file_path() const noexcept -> const std::filesystem::path& { return file_path_; }
};

class UnsupportedFormatError : public OutputError {
public:
  explicit UnsupportedFormatError(OutputFormat format, std::source_location location = std::source_location::current())
      : OutputError(std::format("Unsupported output format: {}", format_name(format)), location) {}
};

} // namespace seagas::io::output
