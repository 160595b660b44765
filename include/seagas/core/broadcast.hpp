#pragma once
#include "containers.hpp"
#include "exceptions.hpp"
#include <concepts>
#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <type_traits>
#include <vector>

namespace seagas::core {

/**
 * @brief Element-wise evaluation of a two-operand scalar kernel over
 *        scalars, 1-D vectors or 2-D fields.
 *
 * Operands follow array broadcasting rules: per dimension the extents must
 * match or one of them must be 1. A scalar broadcasts everywhere. The result
 * has the container type of the first operand (of the second when the first
 * is a scalar) and the broadcast shape. Scalar/scalar returns a plain double.
 *
 * Vectors and fields cannot be mixed in one call.
 */

template <typename T>
concept FieldContainer = std::same_as<T, Field> || std::same_as<T, std::vector<double>>;

template <typename A, typename B>
concept BroadcastPair = (std::same_as<A, double> && std::same_as<B, double>) ||
                        (std::same_as<A, double> && FieldContainer<B>) ||
                        (FieldContainer<A> && std::same_as<B, double>) ||
                        (FieldContainer<A> && std::same_as<A, B>);

// At least one operand is array-shaped
template <typename A, typename B>
concept ArrayBroadcastPair = BroadcastPair<A, B> && !(std::same_as<A, double> && std::same_as<B, double>);

template <typename A, typename B>
using broadcast_result_t = std::conditional_t<std::same_as<A, double>, B, A>;

namespace detail {

template <typename T> struct is_expected : std::false_type {};
template <typename T, typename E> struct is_expected<std::expected<T, E>> : std::true_type {};

[[nodiscard]] inline auto rows(double) noexcept -> Eigen::Index { return 1; }
[[nodiscard]] inline auto rows(const std::vector<double>& v) noexcept -> Eigen::Index {
  return static_cast<Eigen::Index>(v.size());
}
[[nodiscard]] inline auto rows(const Field& f) noexcept -> Eigen::Index { return f.rows(); }

[[nodiscard]] inline auto cols(double) noexcept -> Eigen::Index { return 1; }
[[nodiscard]] inline auto cols(const std::vector<double>&) noexcept -> Eigen::Index { return 1; }
[[nodiscard]] inline auto cols(const Field& f) noexcept -> Eigen::Index { return f.cols(); }

[[nodiscard]] inline auto value_at(double v, Eigen::Index, Eigen::Index) noexcept -> double { return v; }
[[nodiscard]] inline auto value_at(const std::vector<double>& v, Eigen::Index i, Eigen::Index) -> double {
  return v[v.size() == 1 ? 0 : static_cast<std::size_t>(i)];
}
[[nodiscard]] inline auto value_at(const Field& f, Eigen::Index i, Eigen::Index j) -> double {
  return f(f.rows() == 1 ? 0 : i, f.cols() == 1 ? 0 : j);
}

[[nodiscard]] inline auto broadcast_extent(Eigen::Index a, Eigen::Index b) noexcept -> std::optional<Eigen::Index> {
  if (a == b || b == 1)
    return a;
  if (a == 1)
    return b;
  return std::nullopt;
}

template <typename Kernel>
[[nodiscard]] auto evaluate(Kernel& kernel, double a, double b) -> std::expected<double, PropertyError> {
  using R = std::invoke_result_t<Kernel&, double, double>;
  if constexpr (is_expected<R>::value) {
    return kernel(a, b);
  } else {
    return static_cast<double>(kernel(a, b));
  }
}

} // namespace detail

template <typename A, typename B, typename Kernel>
  requires BroadcastPair<A, B>
[[nodiscard]] auto broadcast(const A& a, const B& b,
                             Kernel&& kernel) -> std::expected<broadcast_result_t<A, B>, PropertyError> {
  using Result = broadcast_result_t<A, B>;

  if constexpr (std::same_as<Result, double>) {
    return detail::evaluate(kernel, a, b);
  } else {
    const auto n_rows = detail::broadcast_extent(detail::rows(a), detail::rows(b));
    const auto n_cols = detail::broadcast_extent(detail::cols(a), detail::cols(b));
    if (!n_rows || !n_cols) {
      return std::unexpected(PropertyError(
          PropertyError::Kind::ShapeMismatch,
          std::format("Operands with shapes ({}, {}) and ({}, {}) cannot be broadcast together", detail::rows(a),
                      detail::cols(a), detail::rows(b), detail::cols(b))));
    }

    Result result;
    if constexpr (std::same_as<Result, std::vector<double>>) {
      result.resize(static_cast<std::size_t>(*n_rows));
    } else {
      result.resize(*n_rows, *n_cols);
    }

    for (Eigen::Index j = 0; j < *n_cols; ++j) {
      for (Eigen::Index i = 0; i < *n_rows; ++i) {
        auto value = detail::evaluate(kernel, detail::value_at(a, i, j), detail::value_at(b, i, j));
        if (!value) {
          return std::unexpected(value.error());
        }
        if constexpr (std::same_as<Result, std::vector<double>>) {
          result[static_cast<std::size_t>(i)] = value.value();
        } else {
          result(i, j) = value.value();
        }
      }
    }
    return result;
  }
}

} // namespace seagas::core
