// formlets/form/collector.hpp - Turning submitted input into a value tree
//
// Collectors mirror the structure of a form the same way builders do: one
// input collector per field, combined through function application.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "formlets/basic/casting.hpp"
#include "formlets/render/render_dict.hpp"
#include "formlets/value/value.hpp"

namespace formlets
{

enum class CollectorKind : uint8_t {
  Input,  ///< Raw value of one named field
  Const,  ///< Fixed value, ignores input
  Apply,  ///< Function collector applied to argument collector
  Map,    ///< Transformation of another collector's value, errors re-attributed
  Check,  ///< Predicate over another collector's value
};

class Collector;
using CollectorPtr = std::shared_ptr<const Collector>;

class Collector
{
public:
  const CollectorKind kind;

  Collector(const Collector &) = delete;
  Collector & operator=(const Collector &) = delete;

  [[nodiscard]] CollectorKind get_kind() const noexcept { return kind; }

  /**
   * Collect a value from submitted input.
   *
   * @throws MissingInputError if a field read by this collector is absent
   */
  [[nodiscard]] ValuePtr collect(const InputMap & input) const;

protected:
  explicit Collector(CollectorKind k) : kind(k) {}
  ~Collector() = default;
};

template <typename Derived, CollectorKind K>
class CollectorBase : public Collector
{
public:
  static bool classof(const Collector * collector) { return collector->get_kind() == K; }

protected:
  CollectorBase() : Collector(K) {}
};

/// Yields the raw string submitted for `name`, with `name` as origin.
class InputCollector final : public CollectorBase<InputCollector, CollectorKind::Input>
{
public:
  explicit InputCollector(std::string name) : name_(std::move(name)) {}

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  std::string name_;
};

class ConstCollector final : public CollectorBase<ConstCollector, CollectorKind::Const>
{
public:
  explicit ConstCollector(ValuePtr value);

  [[nodiscard]] const ValuePtr & value() const noexcept { return value_; }

private:
  ValuePtr value_;
};

class ApplyCollector final : public CollectorBase<ApplyCollector, CollectorKind::Apply>
{
public:
  ApplyCollector(CollectorPtr function, CollectorPtr argument);

  [[nodiscard]] const Collector & function() const noexcept { return *function_; }
  [[nodiscard]] const Collector & argument() const noexcept { return *argument_; }

private:
  CollectorPtr function_;
  CollectorPtr argument_;
};

/**
 * Applies a one argument transformation. Errors coming out of the
 * transformation are re-created on the collected value so they carry its
 * origin; an erroneous or pending input is passed through untouched.
 */
class MapCollector final : public CollectorBase<MapCollector, CollectorKind::Map>
{
public:
  MapCollector(CollectorPtr inner, FunctionPtr transformation);

  [[nodiscard]] const Collector & inner() const noexcept { return *inner_; }
  [[nodiscard]] const FunctionPtr & transformation() const noexcept { return transformation_; }

private:
  CollectorPtr inner_;
  FunctionPtr transformation_;
};

/// Replaces the collected value by an error with `message` if the predicate
/// (a one argument function yielding bool) does not hold.
class CheckCollector final : public CollectorBase<CheckCollector, CollectorKind::Check>
{
public:
  CheckCollector(CollectorPtr inner, FunctionPtr predicate, std::string message);

  [[nodiscard]] const Collector & inner() const noexcept { return *inner_; }
  [[nodiscard]] const FunctionPtr & predicate() const noexcept { return predicate_; }
  [[nodiscard]] const std::string & message() const noexcept { return message_; }

private:
  CollectorPtr inner_;
  FunctionPtr predicate_;
  std::string message_;
};

// ============================================================================
// Factories
// ============================================================================

[[nodiscard]] CollectorPtr make_input_collector(std::string name);

[[nodiscard]] CollectorPtr make_const_collector(ValuePtr value);

[[nodiscard]] CollectorPtr make_apply_collector(CollectorPtr function, CollectorPtr argument);

[[nodiscard]] CollectorPtr make_map_collector(CollectorPtr inner, FunctionPtr transformation);

[[nodiscard]] CollectorPtr make_check_collector(
  CollectorPtr inner, FunctionPtr predicate, std::string message);

}  // namespace formlets
