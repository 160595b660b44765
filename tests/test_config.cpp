#include "seagas/io/config_manager.hpp"
#include "seagas/io/yaml_parser.hpp"
#include "test_utils.hpp"
#include <fstream>
#include <string>
#include <vector>

using seagas::gas::Gas;
using seagas::io::Quantity;
using seagas::test::check;

namespace {

auto parse(std::string_view yaml) -> std::expected<seagas::io::Configuration, seagas::core::ConfigurationError> {
  auto parser = seagas::io::YamlParser::from_string(yaml);
  if (!parser) {
    return std::unexpected(seagas::core::ConfigurationError(parser.error().message()));
  }
  return parser->parse();
}

auto rejects(std::string_view yaml, std::string_view needle) -> bool {
  auto config = parse(yaml);
  return !config && config.error().message().find(needle) != std::string::npos;
}

void test_full_document() {
  auto config = parse(R"(
table:
  gases: [o2, CO2, Ar, O2]
  quantities: [solubility, schmidt_number, viscosity]
  salinity: {min: 30, max: 36, points: 4}
  temperature: {min: 0, max: 30, points: 7}
seawater:
  provider: EOS-80
output:
  directory: out
  case_name: run1
  formats: [csv, h5]
)");
  check(config.has_value(), "full document parses");
  if (!config) {
    std::cerr << config.error().message() << std::endl;
    return;
  }

  check(config->table.gases == std::vector<Gas>{Gas::O2, Gas::CO2, Gas::Ar}, "gases de-duplicated in order");
  check(config->table.quantities ==
            std::vector<Quantity>{Quantity::Solubility, Quantity::SchmidtNumber, Quantity::Viscosity},
        "quantity aliases resolved");

  const auto salinities = config->table.salinity.values();
  check(salinities.size() == 4 && salinities.front() == 30.0 && salinities.back() == 36.0, "salinity axis");
  check(std::abs(salinities[1] - 32.0) < 1e-12, "salinity axis is evenly spaced");
  check(config->table.temperature.values().size() == 7, "temperature axis");

  check(config->seawater.provider == seagas::io::SeawaterConfig::Provider::EOS80, "provider alias");
  check(config->output.output_directory == "out", "output directory");
  check(config->output.case_name == "run1", "case name");
  check(config->output.formats ==
            std::vector<seagas::io::OutputFormat>{seagas::io::OutputFormat::CSV, seagas::io::OutputFormat::HDF5},
        "formats");
}

void test_defaults() {
  auto config = parse(R"(
table:
  gases: [N2]
  quantities: [solubility]
)");
  check(config.has_value(), "minimal document parses");
  if (!config) {
    return;
  }
  check(config->table.salinity.min == 0.0 && config->table.salinity.max == 40.0, "default salinity range");
  check(config->table.salinity.points == 9, "default salinity points");
  check(config->table.temperature.min == -2.0 && config->table.temperature.max == 40.0, "default temperature range");
  check(config->seawater.provider == seagas::io::SeawaterConfig::Provider::EOS80, "EOS-80 by default");
  check(config->output.formats == std::vector<seagas::io::OutputFormat>{seagas::io::OutputFormat::HDF5},
        "HDF5 by default");
  check(config->output.case_name == "table", "default case name");

  auto single = parse(R"(
table:
  gases: [He]
  quantities: [diffusivity]
  salinity: {min: 35, max: 35, points: 1}
)");
  check(single && single->table.salinity.values() == std::vector<double>{35.0}, "single-point axis");
}

void test_rejections() {
  check(rejects("output: {case_name: x}\n", "table"), "missing table section");
  check(rejects("table: {quantities: [solubility]}\n", "gases"), "missing gases");
  check(rejects("table: {gases: [], quantities: [solubility]}\n", "must not be empty"), "empty gas list");
  check(rejects("table: {gases: [SF6], quantities: [solubility]}\n", "SF6"), "unknown gas");
  check(rejects("table: {gases: [O2], quantities: [enthalpy]}\n", "enthalpy"), "unknown quantity");
  check(rejects("table: {gases: [Xe], quantities: [solubility]}\n", "Xe"), "solubility for a gas without a fit");
  check(rejects("table: {gases: [N2O], quantities: [schmidt]}\n", "N2O"), "Schmidt number for N2O");
  check(rejects("table: {gases: [O2], quantities: [solubility], salinity: {min: 10, max: 5, points: 3}}\n",
                "greater than min"),
        "inverted axis");
  check(rejects("table: {gases: [O2], quantities: [solubility], temperature: {points: 0}}\n", "points"),
        "zero points");
  check(rejects("table: {gases: [O2], quantities: [solubility], salinity: {min: 0, max: 5, points: 1}}\n",
                "single point"),
        "single point with distinct bounds");
  check(rejects("table: {gases: [O2], quantities: [solubility], salinity: {min: .nan, max: 5, points: 2}}\n",
                "finite"),
        "NaN bound");
  check(rejects("table: {gases: [O2], quantities: [solubility]}\nseawater: {provider: unesco83}\n", "unesco83"),
        "unknown provider");
  check(rejects("table: {gases: [O2], quantities: [solubility]}\noutput: {formats: [vtk]}\n", "vtk"),
        "unknown output format");
  check(rejects("table: {gases: [O2], quantities: [solubility]}\noutput: {case_name: ''}\n", "case_name"),
        "empty case name");

  // Xe and N2O still work for the quantities they do support
  check(parse("table: {gases: [Xe], quantities: [diffusivity, schmidt]}\n").has_value(), "Xe transport accepted");
  check(parse("table: {gases: [N2O], quantities: [solubility]}\n").has_value(), "N2O solubility accepted");
}

void test_configuration_manager() {
  const auto dir = seagas::test::scratch_directory("config");
  const auto path = dir / "tables.yaml";
  {
    std::ofstream file(path);
    file << "table:\n  gases: [Ne, Kr]\n  quantities: [solubility]\n";
  }

  seagas::io::ConfigurationManager manager;
  auto config = manager.load(path.string());
  check(config.has_value(), "configuration file loads");
  if (config) {
    check(config->table.gases == std::vector<Gas>{Gas::Ne, Gas::Kr}, "gases from file");
  }
  check(manager.config_file_path() == std::filesystem::absolute(path), "resolved path remembered");

  check(manager.current().has_value(), "manager keeps the loaded configuration");

  seagas::io::ConfigurationManager renamed;
  auto overridden = renamed.load(path.string(), std::string("coastal"));
  check(overridden && overridden->output.case_name == "coastal", "command-line case name replaces output.case_name");

  seagas::io::ConfigurationManager nested;
  check(!nested.load(path.string(), std::string("runs/coastal")), "case name with a path separator rejected");
  check(!seagas::io::ConfigurationManager::validate_case_name(".."), "parent directory is not a case name");
  check(seagas::io::ConfigurationManager::validate_case_name("ocean_2024").has_value(), "plain case name accepted");

  seagas::io::ConfigurationManager missing;
  auto none = missing.load((dir / "absent.yaml").string());
  check(!none, "missing file rejected");

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  test_full_document();
  test_defaults();
  test_rejections();
  test_configuration_manager();
  return seagas::test::finish();
}
