#pragma once
#include "../core/exceptions.hpp"
#include <array>
#include <expected>
#include <string_view>

namespace seagas::gas {

// Closed set of dissolved gases known to the library. Every operation taking
// a Gas switches over it exhaustively.
enum class Gas { He, Ne, Ar, Kr, Xe, N2, N2O, O2, CO2, CH4, H2 };

inline constexpr std::size_t gas_count = 11;

[[nodiscard]] constexpr auto all_gases() noexcept -> std::array<Gas, gas_count> {
  return {Gas::He, Gas::Ne, Gas::Ar, Gas::Kr, Gas::Xe, Gas::N2, Gas::N2O, Gas::O2, Gas::CO2, Gas::CH4, Gas::H2};
}

[[nodiscard]] constexpr auto symbol(Gas gas) noexcept -> std::string_view {
  switch (gas) {
  case Gas::He:
    return "He";
  case Gas::Ne:
    return "Ne";
  case Gas::Ar:
    return "Ar";
  case Gas::Kr:
    return "Kr";
  case Gas::Xe:
    return "Xe";
  case Gas::N2:
    return "N2";
  case Gas::N2O:
    return "N2O";
  case Gas::O2:
    return "O2";
  case Gas::CO2:
    return "CO2";
  case Gas::CH4:
    return "CH4";
  case Gas::H2:
    return "H2";
  }
  return "?";
}

// Case-insensitive match against the gas symbols
[[nodiscard]] auto parse_gas(std::string_view token) -> std::expected<Gas, core::PropertyError>;

} // namespace seagas::gas
