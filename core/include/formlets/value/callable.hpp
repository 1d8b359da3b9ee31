// formlets/value/callable.hpp - Function values from ordinary callables
//
// fn() deduces the arity from a callable's parameter list and unwraps each
// payload to the decayed parameter type before calling it:
//
//   auto add = fn([](int64_t a, int64_t b) { return a + b; }, "add");
//   add->apply(make_plain(int64_t{3}))->apply(make_plain(int64_t{4}))->get_as<int64_t>();  // 7
//
// A parameter of type ValuePtr receives arguments that were still applicable
// when the call was made.
//
#pragma once

#include <any>
#include <cstddef>
#include <gsl/span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "formlets/value/value.hpp"

namespace formlets
{

namespace detail
{

template <typename T>
struct CallableTraits : CallableTraits<decltype(&T::operator())>
{
};

template <typename R, typename... Args>
struct CallableTraits<R (*)(Args...)>
{
  using result_type = R;
  using arg_types = std::tuple<std::decay_t<Args>...>;
  static constexpr std::size_t arity = sizeof...(Args);
};

template <typename R, typename... Args>
struct CallableTraits<R(Args...)> : CallableTraits<R (*)(Args...)>
{
};

template <typename C, typename R, typename... Args>
struct CallableTraits<R (C::*)(Args...) const> : CallableTraits<R (*)(Args...)>
{
};

template <typename C, typename R, typename... Args>
struct CallableTraits<R (C::*)(Args...)> : CallableTraits<R (*)(Args...)>
{
};

template <typename T>
[[nodiscard]] const T & payload_arg(
  gsl::span<const std::any> args, std::size_t index, const std::string & name)
{
  const std::any & arg = args[index];
  if (const T * p = std::any_cast<T>(&arg)) {
    return *p;
  }
  throw PayloadTypeError(describe_payload_mismatch(
    arg.type(), typeid(T), name + " argument #" + std::to_string(index + 1)));
}

template <typename F, typename ArgTuple, std::size_t... I>
std::any invoke_unpacked(
  F & f, gsl::span<const std::any> args, const std::string & name, std::index_sequence<I...>)
{
  using R = decltype(f(payload_arg<std::tuple_element_t<I, ArgTuple>>(args, I, name)...));
  if constexpr (std::is_void_v<R>) {
    f(payload_arg<std::tuple_element_t<I, ArgTuple>>(args, I, name)...);
    return std::any{};
  } else if constexpr (std::is_convertible_v<R, ValuePtr>) {
    return std::any(ValuePtr(f(payload_arg<std::tuple_element_t<I, ArgTuple>>(args, I, name)...)));
  } else {
    return std::any(f(payload_arg<std::tuple_element_t<I, ArgTuple>>(args, I, name)...));
  }
}

}  // namespace detail

/**
 * Wrap a callable (lambda, function pointer, functor with a single
 * operator()) in an unapplied function value.
 */
template <typename F>
[[nodiscard]] FunctionPtr fn(F f, std::string name = "<lambda>")
{
  using Callable = std::decay_t<F>;
  using Traits = detail::CallableTraits<Callable>;
  using ArgTuple = typename Traits::arg_types;

  Operation op = [f = Callable(std::move(f)), name](gsl::span<const std::any> args) mutable {
    if (args.size() != Traits::arity) {
      throw ContractViolation(
        name + ": called with " + std::to_string(args.size()) + " argument(s), expected " +
        std::to_string(Traits::arity));
    }
    return detail::invoke_unpacked<Callable, ArgTuple>(
      f, args, name, std::make_index_sequence<Traits::arity>{});
  };
  return make_function(Traits::arity, std::move(name), std::move(op));
}

}  // namespace formlets
