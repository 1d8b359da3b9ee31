// formlets/form/collector.cpp - Collector implementation
//
#include "formlets/form/collector.hpp"

#include <fmt/core.h>

#include "formlets/basic/errors.hpp"

namespace formlets
{

namespace
{

ValuePtr collect_input(const InputCollector & c, const InputMap & input)
{
  const auto it = input.find(c.name());
  if (it == input.end()) {
    throw MissingInputError(c.name());
  }
  return make_plain(std::any(it->second), c.name());
}

ValuePtr collect_map(const MapCollector & c, const InputMap & input)
{
  ValuePtr value = c.inner().collect(input);
  if (value->is_applicable()) {
    return value;
  }

  ValuePtr result = c.transformation()->apply(value);
  if (result->is_error()) {
    return make_error(result->error(), value);
  }
  return result;
}

ValuePtr collect_check(const CheckCollector & c, const InputMap & input)
{
  ValuePtr value = c.inner().collect(input);
  if (value->is_applicable()) {
    return value;
  }

  const ValuePtr verdict = c.predicate()->apply(value);
  if (verdict->is_error()) {
    return make_error(verdict->error(), value);
  }
  if (!verdict->get_as<bool>()) {
    return make_error(c.message(), value);
  }
  return value;
}

}  // namespace

ValuePtr Collector::collect(const InputMap & input) const
{
  switch (kind) {
    case CollectorKind::Input:
      return collect_input(*cast<InputCollector>(this), input);
    case CollectorKind::Const:
      return cast<ConstCollector>(this)->value();
    case CollectorKind::Apply: {
      const auto * c = cast<ApplyCollector>(this);
      ValuePtr fn = c->function().collect(input);
      return fn->apply(c->argument().collect(input));
    }
    case CollectorKind::Map:
      return collect_map(*cast<MapCollector>(this), input);
    case CollectorKind::Check:
      return collect_check(*cast<CheckCollector>(this), input);
  }
  throw ContractViolation("unknown collector kind");
}

ConstCollector::ConstCollector(ValuePtr value) : value_(std::move(value))
{
  if (!value_) {
    throw ContractViolation("const collector needs a value");
  }
}

ApplyCollector::ApplyCollector(CollectorPtr function, CollectorPtr argument)
: function_(std::move(function)), argument_(std::move(argument))
{
  if (!function_ || !argument_) {
    throw ContractViolation("apply collector needs function and argument collectors");
  }
}

MapCollector::MapCollector(CollectorPtr inner, FunctionPtr transformation)
: inner_(std::move(inner)), transformation_(std::move(transformation))
{
  if (!inner_ || !transformation_) {
    throw ContractViolation("map collector needs a collector and a transformation");
  }
  if (transformation_->arity() != 1) {
    throw ContractViolation(fmt::format(
      "transformation '{}' must take exactly one argument, takes {}", transformation_->name(),
      transformation_->arity()));
  }
}

CheckCollector::CheckCollector(CollectorPtr inner, FunctionPtr predicate, std::string message)
: inner_(std::move(inner)), predicate_(std::move(predicate)), message_(std::move(message))
{
  if (!inner_ || !predicate_) {
    throw ContractViolation("check collector needs a collector and a predicate");
  }
  if (predicate_->arity() != 1) {
    throw ContractViolation(fmt::format(
      "predicate '{}' must take exactly one argument, takes {}", predicate_->name(),
      predicate_->arity()));
  }
}

CollectorPtr make_input_collector(std::string name)
{
  return std::make_shared<InputCollector>(std::move(name));
}

CollectorPtr make_const_collector(ValuePtr value)
{
  return std::make_shared<ConstCollector>(std::move(value));
}

CollectorPtr make_apply_collector(CollectorPtr function, CollectorPtr argument)
{
  return std::make_shared<ApplyCollector>(std::move(function), std::move(argument));
}

CollectorPtr make_map_collector(CollectorPtr inner, FunctionPtr transformation)
{
  return std::make_shared<MapCollector>(std::move(inner), std::move(transformation));
}

CollectorPtr make_check_collector(CollectorPtr inner, FunctionPtr predicate, std::string message)
{
  return std::make_shared<CheckCollector>(std::move(inner), std::move(predicate), std::move(message));
}

}  // namespace formlets
