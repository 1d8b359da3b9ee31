// formlets/value/value.hpp - Plain values, curried function values and errors
//
// A Value is either a plain payload, a possibly partially applied function, or
// an error standing in for a failed computation. Values are immutable and
// shared; every transition (applying an argument, reifying an exception)
// produces a new Value.
//
#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <gsl/span>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "formlets/basic/casting.hpp"
#include "formlets/basic/errors.hpp"

namespace formlets
{

// ============================================================================
// Value Kind
// ============================================================================

/**
 * Kind of value. The set is closed: every switch over it is exhaustive.
 */
enum class ValueKind : uint8_t {
  Plain,     ///< Terminal payload
  Function,  ///< Curried call, possibly still waiting for arguments
  Error,     ///< Failed computation
};

class Value;
class FunctionValue;

using ValuePtr = std::shared_ptr<const Value>;
using FunctionPtr = std::shared_ptr<const FunctionValue>;

/// Name of the form field a value belongs to, if any.
using Origin = std::optional<std::string>;

/// Reason carried by the error produced when a function is called with an
/// erroneous argument. Field level messages are recovered per origin by
/// RenderDict, not from this text.
inline constexpr const char * k_argument_error_reason = "Function arguments contain errors.";

// ============================================================================
// Value
// ============================================================================

/**
 * Base of the value hierarchy.
 *
 * The public operations dispatch over `kind`; concrete classes only store
 * data. Values must be created through the make_* factories (they are always
 * owned by a shared_ptr).
 */
class Value : public std::enable_shared_from_this<Value>
{
public:
  const ValueKind kind;

  Value(const Value &) = delete;
  Value & operator=(const Value &) = delete;
  Value(Value &&) = delete;
  Value & operator=(Value &&) = delete;

  [[nodiscard]] ValueKind get_kind() const noexcept { return kind; }

  [[nodiscard]] const Origin & origin() const noexcept { return origin_; }

  /**
   * Payload of a plain value or of a satisfied function's result.
   *
   * @throws NotAValueError if the value still needs arguments
   * @throws GetOnErrorError if the value is (or evaluates to) an error
   */
  [[nodiscard]] const std::any & get() const;

  /// get() with the payload unwrapped to T. Throws PayloadTypeError on mismatch.
  template <typename T>
  [[nodiscard]] const T & get_as() const;

  /**
   * Apply this value to an argument, yielding a new value.
   *
   * Errors absorb any argument and return themselves.
   *
   * @throws NotApplicableError on a plain value or a null argument
   */
  [[nodiscard]] ValuePtr apply(const ValuePtr & to) const;

  /// True while the value can not yet be used as a final result.
  [[nodiscard]] bool is_applicable() const;

  [[nodiscard]] bool is_error() const;

  /// Reason of the error. Throws NotAnErrorError if this is no error.
  [[nodiscard]] const std::string & error() const;

protected:
  Value(ValueKind k, Origin origin) : kind(k), origin_(std::move(origin)) {}
  ~Value() = default;

private:
  Origin origin_;
};

/**
 * CRTP base implementing classof() for a concrete value class.
 */
template <typename Derived, ValueKind K>
class ValueBase : public Value
{
public:
  static constexpr ValueKind static_kind = K;

  static bool classof(const Value * value) { return value->get_kind() == K; }

protected:
  explicit ValueBase(Origin origin) : Value(K, std::move(origin)) {}
};

// ============================================================================
// Plain Value
// ============================================================================

class PlainValue final : public ValueBase<PlainValue, ValueKind::Plain>
{
public:
  PlainValue(std::any payload, Origin origin)
  : ValueBase(std::move(origin)), payload_(std::move(payload))
  {
  }

  [[nodiscard]] const std::any & payload() const noexcept { return payload_; }

private:
  std::any payload_;
};

// ============================================================================
// Function Value
// ============================================================================

/**
 * Operation wrapped by a function value. Receives one payload per bound
 * argument, in order. An argument that was still applicable when the call was
 * made is passed as the ValuePtr itself.
 *
 * Returning a ValuePtr hands that value back unchanged; any other result is
 * wrapped in a PlainValue.
 */
using Operation = std::function<std::any(gsl::span<const std::any>)>;

/**
 * One exception kind a function turns into an ErrorValue instead of letting
 * it escape from the call.
 */
struct ExceptionFilter
{
  std::string kind_name;
  std::function<bool(const std::exception &)> matches;

  template <typename E>
  [[nodiscard]] static ExceptionFilter of(std::string kind_name = typeid(E).name())
  {
    static_assert(std::is_base_of_v<std::exception, E>, "only std::exception kinds can be reified");
    return ExceptionFilter{
      std::move(kind_name),
      [](const std::exception & e) { return dynamic_cast<const E *>(&e) != nullptr; }};
  }
};

class FunctionValue final : public ValueBase<FunctionValue, ValueKind::Function>
{
public:
  FunctionValue(
    std::size_t arity, std::string name, Operation operation, std::vector<ValuePtr> args = {},
    std::vector<ExceptionFilter> filters = {}, Origin origin = std::nullopt);

  /// Number of arguments still required.
  [[nodiscard]] std::size_t arity() const noexcept { return arity_; }

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  /// Arguments bound so far, in application order.
  [[nodiscard]] gsl::span<const ValuePtr> args() const noexcept { return args_; }

  [[nodiscard]] gsl::span<const ExceptionFilter> filters() const noexcept { return filters_; }

  /// Applied often enough to have a result?
  [[nodiscard]] bool is_satisfied() const noexcept { return arity_ == 0; }

  /**
   * Result of the call. Computed on first access only; concurrent first
   * accesses run the operation once and all observe the same value.
   *
   * Exceptions whose kind is not in the filter propagate and leave the result
   * uncomputed.
   *
   * An error raised by this call (a reified exception or erroneous arguments)
   * has this function as its original. The function only holds that error
   * weakly; once every holder has released it, the next access builds an
   * equal error again without running the operation.
   *
   * @throws NotAValueError if the function is not satisfied
   */
  [[nodiscard]] ValuePtr result() const;

  /// Reason of the result error, with the same lifetime as this function.
  /// @throws NotAnErrorError if the result is no error
  [[nodiscard]] const std::string & result_error() const;

  /// Copy of this function that additionally reifies `filter`.
  [[nodiscard]] FunctionPtr catch_and_reify(ExceptionFilter filter) const;

  template <typename E>
  [[nodiscard]] FunctionPtr catch_and_reify() const
  {
    return catch_and_reify(ExceptionFilter::of<E>());
  }

  /// New function with `arg` appended to the bound arguments.
  [[nodiscard]] FunctionPtr deferred_call(ValuePtr arg) const;

private:
  void compute_result() const;
  [[nodiscard]] bool has_erroneous_argument() const;
  [[nodiscard]] ValuePtr call_operation() const;
  [[nodiscard]] ValuePtr to_value(std::any raw) const;

  std::size_t arity_;
  std::string name_;
  Operation operation_;
  std::vector<ValuePtr> args_;
  std::vector<ExceptionFilter> filters_;

  mutable std::once_flag result_once_;
  mutable ValuePtr result_;

  // Set instead of result_ when the call itself failed. The error points back
  // at this function, so it is cached weakly.
  mutable std::optional<std::string> own_error_reason_;
  mutable std::mutex own_error_mutex_;
  mutable std::weak_ptr<const Value> own_error_;
};

// ============================================================================
// Error Value
// ============================================================================

class ErrorValue final : public ValueBase<ErrorValue, ValueKind::Error>
{
public:
  /// @throws ContractViolation if `original` is null
  ErrorValue(std::string reason, ValuePtr original);

  [[nodiscard]] const std::string & reason() const noexcept { return reason_; }

  /// The value this error replaces.
  [[nodiscard]] const ValuePtr & original_value() const noexcept { return original_; }

private:
  std::string reason_;
  ValuePtr original_;
};

// ============================================================================
// Factories
// ============================================================================

[[nodiscard]] ValuePtr make_plain(std::any payload, Origin origin = std::nullopt);

/// String literals are stored as std::string, not as const char *. Taking an
/// array keeps null pointer constants such as `0` on the std::any overload.
template <std::size_t N>
[[nodiscard]] ValuePtr make_plain(const char (&text)[N], Origin origin = std::nullopt)
{
  return make_plain(std::any(std::string(text)), std::move(origin));
}

[[nodiscard]] ValuePtr make_error(std::string reason, ValuePtr original);

[[nodiscard]] FunctionPtr make_function(
  std::size_t arity, std::string name, Operation operation, std::vector<ValuePtr> args = {});

// ============================================================================
// Template implementation
// ============================================================================

namespace detail
{

[[nodiscard]] std::string describe_payload_mismatch(
  const std::type_info & held, const std::type_info & wanted, const std::string & context);

}  // namespace detail

template <typename T>
const T & Value::get_as() const
{
  const std::any & payload = get();
  if (const T * p = std::any_cast<T>(&payload)) {
    return *p;
  }
  throw PayloadTypeError(detail::describe_payload_mismatch(payload.type(), typeid(T), "get_as"));
}

}  // namespace formlets
