// formlets/value/value_visitor.hpp - CRTP visitors over value trees
#pragma once

#include "formlets/basic/casting.hpp"
#include "formlets/value/value.hpp"

namespace formlets
{

/**
 * CRTP visitor dispatching on the value kind.
 *
 * Usage:
 * @code
 *   class CountErrors : public ValueVisitor<CountErrors, void> {
 *   public:
 *     void visit_error(const ErrorValue *) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * Visiting never evaluates a function: traversal is purely structural.
 */
template <typename Derived, typename ReturnType = void>
class ValueVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(const Value * value)
  {
    if (!value) {
      return ReturnType();
    }

    switch (value->get_kind()) {
      case ValueKind::Plain:
        return get_derived().visit_plain(cast<PlainValue>(value));
      case ValueKind::Function:
        return get_derived().visit_function(cast<FunctionValue>(value));
      case ValueKind::Error:
        return get_derived().visit_error(cast<ErrorValue>(value));
    }

    return ReturnType();
  }

  ReturnType visit_plain(const PlainValue * value) { return get_derived().visit_value(value); }
  ReturnType visit_function(const FunctionValue * value) { return get_derived().visit_value(value); }
  ReturnType visit_error(const ErrorValue * value) { return get_derived().visit_value(value); }

  /// Base case - does nothing by default
  ReturnType visit_value(const Value * /*value*/) { return ReturnType(); }
};

/**
 * Visitor that walks into bound arguments and error originals.
 *
 * Override a visit method and call the base implementation to keep
 * descending, or return false to stop the whole traversal.
 */
template <typename Derived>
class RecursiveValueVisitor : public ValueVisitor<Derived, bool>
{
  using Base = ValueVisitor<Derived, bool>;

public:
  using Base::get_derived;

  bool visit_plain(const PlainValue * /*value*/) { return true; }

  bool visit_function(const FunctionValue * value)
  {
    for (const auto & arg : value->args()) {
      if (!get_derived().visit(arg.get())) return false;
    }
    return true;
  }

  bool visit_error(const ErrorValue * value)
  {
    return get_derived().visit(value->original_value().get());
  }
};

}  // namespace formlets
