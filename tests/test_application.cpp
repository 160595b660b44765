#include "seagas/core/application_runner.hpp"
#include "test_utils.hpp"
#include <fstream>
#include <string>
#include <vector>

using seagas::test::check;

namespace {

auto run(std::vector<std::string> args) -> seagas::core::ApplicationResult {
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  seagas::core::ApplicationRunner runner;
  return runner.run(static_cast<int>(args.size()), argv.data());
}

} // namespace

int main() {
  const auto dir = seagas::test::scratch_directory("application");
  const auto out = dir / "tables";
  const auto config_path = dir / "run.yaml";
  {
    std::ofstream file(config_path);
    file << "table:\n"
         << "  gases: [O2, CO2]\n"
         << "  quantities: [solubility, schmidt, viscosity]\n"
         << "  salinity: {min: 30, max: 35, points: 2}\n"
         << "  temperature: {min: 0, max: 10, points: 3}\n"
         << "output:\n"
         << "  directory: " << out.string() << "\n"
         << "  case_name: from_config\n"
         << "  formats: [hdf5, csv]\n";
  }

  auto no_args = run({"seagas"});
  check(!no_args.success && no_args.exit_code == 1, "missing config argument exits with 1");

  auto help = run({"seagas", "--help"});
  check(help.success && help.exit_code == 0, "help exits with 0");

  auto missing = run({"seagas", (dir / "absent.yaml").string()});
  check(!missing.success && missing.exit_code == 1, "missing config file exits with 1");

  auto ok = run({"seagas", config_path.string()});
  check(ok.success && ok.exit_code == 0, "table run succeeds");
  check(std::filesystem::exists(out / "from_config.h5"), "HDF5 named after the configured case");
  check(std::filesystem::exists(out / "from_config.csv"), "CSV named after the configured case");

  auto renamed = run({"seagas", config_path.string(), "override"});
  check(renamed.success, "run with case name argument succeeds");
  check(std::filesystem::exists(out / "override.h5"), "command-line case name wins");

  std::filesystem::remove_all(dir);
  return seagas::test::finish();
}
