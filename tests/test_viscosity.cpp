#include "seagas/seawater/eos80_seawater.hpp"
#include "seagas/transport/viscosity.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <vector>

using seagas::test::check;
using seagas::test::check_close;

int main() {
  const seagas::seawater::Eos80Seawater eos80;

  auto seawater = seagas::transport::kinematic_viscosity(eos80, 35.0, 20.0);
  auto fresh = seagas::transport::kinematic_viscosity(eos80, 0.0, 20.0);
  check(seawater && fresh, "kinematic viscosity evaluates");
  if (seawater && fresh) {
    check_close(*seawater, 1.047144649e-6, 1e-8, "nu(35, 20)");
    check_close(*fresh, 9.94183247e-7, 1e-8, "nu(0, 20)");
    check(*seawater > *fresh, "salt raises viscosity");
  }

  bool evaluates = true;
  bool positive = true;
  for (double sp = 0.0; sp <= 40.0; sp += 5.0) {
    for (double pt = -2.0; pt <= 40.0; pt += 2.0) {
      auto nu = seagas::transport::kinematic_viscosity(eos80, sp, pt);
      if (!nu) {
        evaluates = false;
        continue;
      }
      positive = positive && std::isfinite(*nu) && *nu > 0.0;
    }
  }
  check(evaluates, "viscosity evaluates over the oceanic range");
  check(positive, "viscosity positive over the oceanic range");

  std::vector<double> temperature{0.0, 10.0, 20.0, 30.0};
  auto profile = seagas::transport::kinematic_viscosity(eos80, 35.0, temperature);
  check(profile.has_value() && profile->size() == temperature.size(), "vector temperature keeps its length");
  if (profile) {
    bool decreasing = true;
    for (std::size_t i = 1; i < profile->size(); ++i) {
      decreasing = decreasing && (*profile)[i] < (*profile)[i - 1];
    }
    check(decreasing, "viscosity decreases with temperature");
  }

  seagas::core::Field sp(3, 1);
  sp << 0.0, 20.0, 35.0;
  auto column = seagas::transport::kinematic_viscosity(eos80, sp, 20.0);
  check(column.has_value() && column->rows() == 3 && column->cols() == 1, "field shape preserved");
  if (column) {
    check_close((*column)(2, 0), 1.047144649e-6, 1e-8, "field element matches scalar call");
  }

  return seagas::test::finish();
}
