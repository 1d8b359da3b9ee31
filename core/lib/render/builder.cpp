// formlets/render/builder.cpp - Builder rendering
//
#include "formlets/render/builder.hpp"

#include <fmt/core.h>

#include <any>

#include "formlets/basic/errors.hpp"

namespace formlets
{

namespace
{

/// Apply a producer to the dict and check that it settled.
[[nodiscard]] ValuePtr apply_producer(
  const FunctionPtr & producer, const ValuePtr & dict, const std::string & tag_name,
  const char * role)
{
  ValuePtr result = producer->apply(dict);
  const auto * fn = dyn_cast<FunctionValue>(result.get());
  if (fn == nullptr || !fn->is_satisfied()) {
    throw BuilderContractViolation(fmt::format(
      "{} producer '{}' of <{}> must be satisfied after being applied to the render dict",
      role, producer->name(), tag_name));
  }
  return result;
}

}  // namespace

// ============================================================================
// Builder
// ============================================================================

html::Fragment Builder::build_with(const RenderDict & dict) const
{
  switch (kind) {
    case BuilderKind::Const:
      return cast<ConstBuilder>(this)->content();
    case BuilderKind::Combined: {
      const auto * combined = cast<CombinedBuilder>(this);
      html::Fragment left = combined->left().build_with(dict);
      return left.concat(combined->right().build_with(dict));
    }
    case BuilderKind::Tag:
      return cast<TagBuilder>(this)->render(dict);
    case BuilderKind::Delegate:
      return cast<DelegateBuilder>(this)->render(dict);
  }
  throw BuilderContractViolation("unknown builder kind");
}

CombinedBuilder::CombinedBuilder(BuilderPtr left, BuilderPtr right)
: left_(std::move(left)), right_(std::move(right))
{
  if (!left_ || !right_) {
    throw BuilderContractViolation("combined builder needs two sub builders");
  }
}

// ============================================================================
// TagBuilder
// ============================================================================

TagBuilder::TagBuilder(std::string tag_name, FunctionPtr attributes_fn, FunctionPtr content_fn)
: tag_name_(std::move(tag_name)),
  attributes_fn_(std::move(attributes_fn)),
  content_fn_(std::move(content_fn))
{
  if (tag_name_.empty()) {
    throw BuilderContractViolation("tag builder needs a tag name");
  }
  if (!attributes_fn_ || !content_fn_) {
    throw BuilderContractViolation(
      fmt::format("tag builder <{}> needs attributes and content producers", tag_name_));
  }
}

html::Fragment TagBuilder::render(const RenderDict & dict) const
{
  const ValuePtr d = make_plain(std::any(dict));

  const ValuePtr attributes = apply_producer(attributes_fn_, d, tag_name_, "attributes");
  const ValuePtr content = apply_producer(content_fn_, d, tag_name_, "content");

  const auto & attrs = attributes->get_as<html::Attributes>();

  const std::any & payload = content->get();
  if (const auto * fragment = std::any_cast<html::Fragment>(&payload)) {
    return html::Fragment::tag(tag_name_, attrs, *fragment);
  }
  return html::Fragment::tag(tag_name_, attrs, content->get_as<std::optional<html::Fragment>>());
}

// ============================================================================
// DelegateBuilder
// ============================================================================

DelegateBuilder::DelegateBuilder(FragmentSource source, std::optional<std::string> name)
: source_(std::move(source)), name_(std::move(name))
{
  if (!source_) {
    throw BuilderContractViolation("delegate builder needs a fragment source");
  }
}

html::Fragment DelegateBuilder::render(const RenderDict & dict) const
{
  html::Fragment fragment = source_(dict, name_);
  if (!fragment.is_valid()) {
    throw InvalidFragmentError(
      fmt::format("delegate for '{}' returned an invalid fragment", name_.value_or("<unnamed>")));
  }
  return fragment;
}

// ============================================================================
// Factories
// ============================================================================

BuilderPtr make_const(html::Fragment content)
{
  return std::make_shared<ConstBuilder>(std::move(content));
}

BuilderPtr make_text(std::string text) { return make_const(html::Fragment::literal(std::move(text))); }

BuilderPtr make_combined(BuilderPtr left, BuilderPtr right)
{
  return std::make_shared<CombinedBuilder>(std::move(left), std::move(right));
}

BuilderPtr make_tag(std::string tag_name, FunctionPtr attributes_fn, FunctionPtr content_fn)
{
  return std::make_shared<TagBuilder>(
    std::move(tag_name), std::move(attributes_fn), std::move(content_fn));
}

BuilderPtr make_delegate(FragmentSource source, std::optional<std::string> name)
{
  return std::make_shared<DelegateBuilder>(std::move(source), std::move(name));
}

}  // namespace formlets
