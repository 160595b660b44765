#include "seagas/gas/gas.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <string>

namespace seagas::gas {

namespace {
[[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) noexcept -> bool {
  return std::ranges::equal(lhs, rhs, [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}
} // namespace

auto parse_gas(std::string_view token) -> std::expected<Gas, core::PropertyError> {
  for (const auto gas : all_gases()) {
    if (iequals(token, symbol(gas))) {
      return gas;
    }
  }
  return std::unexpected(
      core::PropertyError(core::PropertyError::Kind::UnsupportedGas, std::format("Unknown gas '{}'", token)));
}

} // namespace seagas::gas
