#pragma once
#include "../core/constants.hpp"
#include "../core/exceptions.hpp"
#include "../gas/gas.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace seagas::io {

enum class Quantity { Solubility, Diffusivity, SchmidtNumber, Viscosity };

[[nodiscard]] constexpr auto quantity_name(Quantity quantity) noexcept -> std::string_view {
  switch (quantity) {
  case Quantity::Solubility:
    return "solubility";
  case Quantity::Diffusivity:
    return "diffusivity";
  case Quantity::SchmidtNumber:
    return "schmidt";
  case Quantity::Viscosity:
    return "viscosity";
  }
  return "unknown";
}

// Evenly spaced axis, endpoints included
struct GridAxisConfig {
  double min = 0.0;
  double max = 0.0;
  int points = 1;

  [[nodiscard]] auto values() const -> std::vector<double> {
    std::vector<double> result(static_cast<std::size_t>(points));
    if (points == 1) {
      result[0] = min;
      return result;
    }
    const double step = (max - min) / (points - 1);
    for (int i = 0; i < points; ++i) {
      result[static_cast<std::size_t>(i)] = min + i * step;
    }
    result.back() = max;
    return result;
  }
};

struct TableConfig {
  std::vector<gas::Gas> gases;
  std::vector<Quantity> quantities;
  GridAxisConfig salinity{constants::defaults::salinity_min, constants::defaults::salinity_max,
                          constants::defaults::salinity_points};
  GridAxisConfig temperature{constants::defaults::temperature_min, constants::defaults::temperature_max,
                             constants::defaults::temperature_points};
};

struct SeawaterConfig {
  enum class Provider { EOS80, TEOS10 };
  Provider provider = Provider::EOS80;
};

enum class OutputFormat { HDF5, CSV };

struct OutputConfig {
  std::string output_directory = constants::io::default_output_directory;
  std::string case_name = constants::io::default_case_name;
  std::vector<OutputFormat> formats{OutputFormat::HDF5};
};

struct Configuration {
  TableConfig table;
  SeawaterConfig seawater;
  OutputConfig output;
};

} // namespace seagas::io
