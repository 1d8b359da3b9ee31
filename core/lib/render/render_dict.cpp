// formlets/render/render_dict.cpp - RenderDict implementation
//
#include "formlets/render/render_dict.hpp"

#include <cstdint>

#include "formlets/value/value_visitor.hpp"

namespace formlets
{

namespace
{

/// Records every error with an origin, then keeps descending into the
/// error's original (sibling arguments may hold further errors).
class ErrorCollector : public RecursiveValueVisitor<ErrorCollector>
{
public:
  explicit ErrorCollector(ErrorMap & errors) : errors_(errors) {}

  bool visit_error(const ErrorValue * value)
  {
    if (value->origin()) {
      errors_[*value->origin()].push_back(value->reason());
    }
    return RecursiveValueVisitor::visit_error(value);
  }

private:
  ErrorMap & errors_;
};

}  // namespace

RenderDict::RenderDict(InputMap input, const Value & value)
: RenderDict(std::move(input), value, false)
{
}

RenderDict::RenderDict(InputMap input, const Value & value, bool empty)
: values_(std::move(input)), errors_(compute_from(value)), empty_(empty)
{
}

const RenderDict & RenderDict::empty()
{
  static const RenderDict instance(InputMap{}, *make_plain(std::any(int64_t{0})), true);
  return instance;
}

const std::string * RenderDict::value(std::string_view name) const
{
  const auto it = values_.find(name);
  return it == values_.end() ? nullptr : &it->second;
}

bool RenderDict::value_exists(std::string_view name) const
{
  return values_.find(name) != values_.end();
}

const std::vector<std::string> * RenderDict::errors(std::string_view name) const
{
  const auto it = errors_.find(name);
  return it == errors_.end() ? nullptr : &it->second;
}

ErrorMap RenderDict::compute_from(const Value & value)
{
  ErrorMap errors;
  ErrorCollector collector(errors);
  collector.visit(&value);
  return errors;
}

}  // namespace formlets
