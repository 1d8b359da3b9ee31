// formlets/value/value.cpp - Value algebra implementation
//
#include "formlets/value/value.hpp"

#include <fmt/core.h>

namespace formlets
{

namespace
{

[[nodiscard]] const char * kind_name(ValueKind kind)
{
  switch (kind) {
    case ValueKind::Plain:
      return "plain value";
    case ValueKind::Function:
      return "function value";
    case ValueKind::Error:
      return "error value";
  }
  return "value";
}

}  // namespace

namespace detail
{

std::string describe_payload_mismatch(
  const std::type_info & held, const std::type_info & wanted, const std::string & context)
{
  return fmt::format(
    "{}: payload of type '{}' can't be used as '{}'", context, held.name(), wanted.name());
}

}  // namespace detail

// ============================================================================
// Value
// ============================================================================

const std::any & Value::get() const
{
  switch (kind) {
    case ValueKind::Plain:
      return cast<PlainValue>(this)->payload();
    case ValueKind::Function: {
      const auto * fn = cast<FunctionValue>(this);
      if (!fn->is_satisfied()) {
        throw NotAValueError(fmt::format(
          "can't get value from function '{}': {} more argument(s) required", fn->name(),
          fn->arity()));
      }
      return fn->result()->get();
    }
    case ValueKind::Error:
      throw GetOnErrorError(cast<ErrorValue>(this)->reason());
  }
  throw NotAValueError("can't get value from unknown value kind");
}

ValuePtr Value::apply(const ValuePtr & to) const
{
  if (!to) {
    throw NotApplicableError(fmt::format("can't apply {} to a null value", kind_name(kind)));
  }

  switch (kind) {
    case ValueKind::Plain:
      throw NotApplicableError("can't apply plain value to any value");
    case ValueKind::Function: {
      const auto * fn = cast<FunctionValue>(this);
      if (fn->is_satisfied()) {
        return fn->result()->apply(to);
      }
      return fn->deferred_call(to);
    }
    case ValueKind::Error:
      return shared_from_this();
  }
  throw NotApplicableError("can't apply unknown value kind");
}

bool Value::is_applicable() const
{
  switch (kind) {
    case ValueKind::Plain:
      return false;
    case ValueKind::Function: {
      const auto * fn = cast<FunctionValue>(this);
      return fn->is_satisfied() ? fn->result()->is_applicable() : true;
    }
    case ValueKind::Error:
      return true;
  }
  return false;
}

bool Value::is_error() const
{
  switch (kind) {
    case ValueKind::Plain:
      return false;
    case ValueKind::Function: {
      const auto * fn = cast<FunctionValue>(this);
      return fn->is_satisfied() && fn->result()->is_error();
    }
    case ValueKind::Error:
      return true;
  }
  return false;
}

const std::string & Value::error() const
{
  switch (kind) {
    case ValueKind::Plain:
      throw NotAnErrorError("plain value has no error");
    case ValueKind::Function: {
      const auto * fn = cast<FunctionValue>(this);
      if (!fn->is_satisfied()) {
        throw NotAnErrorError(fmt::format("function '{}' is not satisfied", fn->name()));
      }
      return fn->result_error();
    }
    case ValueKind::Error:
      return cast<ErrorValue>(this)->reason();
  }
  throw NotAnErrorError("unknown value kind has no error");
}

// ============================================================================
// FunctionValue
// ============================================================================

FunctionValue::FunctionValue(
  std::size_t arity, std::string name, Operation operation, std::vector<ValuePtr> args,
  std::vector<ExceptionFilter> filters, Origin origin)
: ValueBase(std::move(origin)),
  arity_(arity),
  name_(std::move(name)),
  operation_(std::move(operation)),
  args_(std::move(args)),
  filters_(std::move(filters))
{
  if (!operation_) {
    throw ContractViolation(fmt::format("function '{}' has no operation", name_));
  }
}

ValuePtr FunctionValue::result() const
{
  if (!is_satisfied()) {
    throw NotAValueError(fmt::format(
      "function '{}' has no result yet: {} more argument(s) required", name_, arity_));
  }
  std::call_once(result_once_, [this] { compute_result(); });
  if (!own_error_reason_) {
    return result_;
  }

  std::lock_guard<std::mutex> lock(own_error_mutex_);
  if (ValuePtr error = own_error_.lock()) {
    return error;
  }
  ValuePtr error = make_error(*own_error_reason_, shared_from_this());
  own_error_ = error;
  return error;
}

const std::string & FunctionValue::result_error() const
{
  const ValuePtr value = result();
  if (own_error_reason_) {
    return *own_error_reason_;
  }
  // result_ keeps the value alive past this call
  return value->error();
}

FunctionPtr FunctionValue::catch_and_reify(ExceptionFilter filter) const
{
  std::vector<ExceptionFilter> filters = filters_;
  filters.push_back(std::move(filter));
  return std::make_shared<FunctionValue>(arity_, name_, operation_, args_, std::move(filters), origin());
}

FunctionPtr FunctionValue::deferred_call(ValuePtr arg) const
{
  // The receiver keeps its own argument list, so the same partially applied
  // function can be applied in several places.
  std::vector<ValuePtr> args = args_;
  args.push_back(std::move(arg));
  return std::make_shared<FunctionValue>(
    arity_ - 1, name_, operation_, std::move(args), filters_, origin());
}

void FunctionValue::compute_result() const
{
  try {
    if (has_erroneous_argument()) {
      own_error_reason_ = k_argument_error_reason;
      return;
    }
    result_ = call_operation();
  } catch (const std::exception & e) {
    for (const auto & filter : filters_) {
      if (filter.matches(e)) {
        own_error_reason_ = e.what();
        return;
      }
    }
    throw;
  }
}

bool FunctionValue::has_erroneous_argument() const
{
  bool has_error = false;
  for (const auto & arg : args_) {
    if (arg->is_error()) {
      has_error = true;
    }
  }
  return has_error;
}

ValuePtr FunctionValue::call_operation() const
{
  std::vector<std::any> raw;
  raw.reserve(args_.size());
  for (const auto & arg : args_) {
    if (arg->is_applicable()) {
      raw.emplace_back(arg);
    } else {
      raw.push_back(arg->get());
    }
  }
  return to_value(operation_(gsl::span<const std::any>(raw.data(), raw.size())));
}

ValuePtr FunctionValue::to_value(std::any raw) const
{
  if (const auto * value = std::any_cast<ValuePtr>(&raw)) {
    if (*value) {
      return *value;
    }
    throw ContractViolation(fmt::format("function '{}' returned a null value", name_));
  }
  if (const auto * fn = std::any_cast<FunctionPtr>(&raw)) {
    if (*fn) {
      return *fn;
    }
    throw ContractViolation(fmt::format("function '{}' returned a null function", name_));
  }
  return make_plain(std::move(raw), origin());
}

// ============================================================================
// ErrorValue
// ============================================================================

ErrorValue::ErrorValue(std::string reason, ValuePtr original)
: ValueBase(original ? original->origin() : Origin{}),
  reason_(std::move(reason)),
  original_(std::move(original))
{
  if (!original_) {
    throw ContractViolation("error value needs an original value");
  }
}

// ============================================================================
// Factories
// ============================================================================

ValuePtr make_plain(std::any payload, Origin origin)
{
  return std::make_shared<PlainValue>(std::move(payload), std::move(origin));
}

ValuePtr make_error(std::string reason, ValuePtr original)
{
  return std::make_shared<ErrorValue>(std::move(reason), std::move(original));
}

FunctionPtr make_function(
  std::size_t arity, std::string name, Operation operation, std::vector<ValuePtr> args)
{
  return std::make_shared<FunctionValue>(arity, std::move(name), std::move(operation), std::move(args));
}

}  // namespace formlets
