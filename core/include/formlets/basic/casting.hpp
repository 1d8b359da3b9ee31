// formlets/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with the closed class hierarchies of this library (Value, Builder,
// Collector). Each concrete class provides a static `classof` predicate over
// its hierarchy root.
//
// Usage:
//   if (isa<ErrorValue>(v)) { ... }
//   const auto * fn = cast<FunctionValue>(v);           // asserts on failure
//   if (const auto * e = dyn_cast<ErrorValue>(v)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace formlets
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/// True if `node` is non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/**
 * Cast to T, asserting on failure.
 *
 * Only use after the kind has been checked (typically inside a switch over
 * the hierarchy's kind enum). Use dyn_cast otherwise.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Cast to T, or nullptr if `node` is null or of another kind.
template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace formlets
