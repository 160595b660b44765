#pragma once
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace seagas::core {

class SeagasException : public std::exception {
private:
  std::string message_;
  std::source_location location_;

public:
  explicit SeagasException(std::string message, std::source_location location = std::source_location::current())
      : message_(std::move(message)), location_(location) {}

  [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

  [[nodiscard]] auto location() const noexcept -> const std::source_location& { return location_; }

  [[nodiscard]] auto message() const noexcept -> const std::string& { return message_; }
};

class ConfigurationError : public SeagasException {
public:
  explicit ConfigurationError(std::string_view message, std::source_location location = std::source_location::current())
      : SeagasException(std::format("Configuration Error: {}", message), location) {}
};

class FileError : public SeagasException {
private:
  std::string filename_;

public:
  explicit FileError(std::string_view message, std::string filename,
                     std::source_location location = std::source_location::current())
      : SeagasException(std::format("File Error ({}): {}", filename, message), location),
        filename_(std::move(filename)) {}

  [[nodiscard]] auto filename() const noexcept -> const std::string& { return filename_; }
};

class ValidationError : public ConfigurationError {
private:
  std::string field_name_;

public:
  explicit ValidationError(std::string_view field_name, std::string_view message,
                           std::source_location location = std::source_location::current())
      : ConfigurationError(std::format("Field '{}': {}", field_name, message), location), field_name_(field_name) {}

  [[nodiscard]] auto field_name() const noexcept -> const std::string& { return field_name_; }
};

// Failure of a property evaluation (solubility, diffusivity, viscosity).
// UpstreamFailure keeps the seawater provider's message untouched.
class PropertyError : public SeagasException {
public:
  enum class Kind { UnsupportedGas, UpstreamFailure, ShapeMismatch };

private:
  Kind kind_;

public:
  explicit PropertyError(Kind kind, std::string_view message,
                         std::source_location location = std::source_location::current())
      : SeagasException(std::string(message), location), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> Kind { return kind_; }
};

} // namespace seagas::core
