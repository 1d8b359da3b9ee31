// formlets/render/builder.hpp - Rendering trees driven by a RenderDict
//
// Builders are assembled once when a form is defined and then rendered many
// times, with the empty dict before submission and with a dict derived from
// the submitted input afterwards.
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "formlets/basic/casting.hpp"
#include "formlets/html/fragment.hpp"
#include "formlets/render/render_dict.hpp"
#include "formlets/value/value.hpp"

namespace formlets
{

enum class BuilderKind : uint8_t {
  Const,     ///< Fixed output
  Combined,  ///< Left output followed by right output
  Tag,       ///< Element whose attributes and content are computed from the dict
  Delegate,  ///< Output produced by another object
};

class Builder;
using BuilderPtr = std::shared_ptr<const Builder>;

/// Rendering contract of objects a DelegateBuilder forwards to.
using FragmentSource =
  std::function<html::Fragment(const RenderDict &, const std::optional<std::string> &)>;

/**
 * Base of the builder hierarchy. Dispatch happens in build_with() over
 * `kind`; concrete builders only hold their parts.
 */
class Builder
{
public:
  const BuilderKind kind;

  Builder(const Builder &) = delete;
  Builder & operator=(const Builder &) = delete;

  [[nodiscard]] BuilderKind get_kind() const noexcept { return kind; }

  [[nodiscard]] html::Fragment build_with(const RenderDict & dict) const;

  /// Render for a form that has not been submitted.
  [[nodiscard]] html::Fragment build() const { return build_with(RenderDict::empty()); }

protected:
  explicit Builder(BuilderKind k) : kind(k) {}
  ~Builder() = default;
};

template <typename Derived, BuilderKind K>
class BuilderBase : public Builder
{
public:
  static bool classof(const Builder * builder) { return builder->get_kind() == K; }

protected:
  BuilderBase() : Builder(K) {}
};

class ConstBuilder final : public BuilderBase<ConstBuilder, BuilderKind::Const>
{
public:
  explicit ConstBuilder(html::Fragment content) : content_(std::move(content)) {}

  [[nodiscard]] const html::Fragment & content() const noexcept { return content_; }

private:
  html::Fragment content_;
};

class CombinedBuilder final : public BuilderBase<CombinedBuilder, BuilderKind::Combined>
{
public:
  CombinedBuilder(BuilderPtr left, BuilderPtr right);

  [[nodiscard]] const Builder & left() const noexcept { return *left_; }
  [[nodiscard]] const Builder & right() const noexcept { return *right_; }

private:
  BuilderPtr left_;
  BuilderPtr right_;
};

/**
 * Element builder. Both producers are applied to the dict (as a plain value)
 * and must be satisfied by that single application: the attributes producer
 * yields html::Attributes, the content producer an html::Fragment or a
 * std::optional<html::Fragment> (nullopt renders a self-closing element).
 */
class TagBuilder final : public BuilderBase<TagBuilder, BuilderKind::Tag>
{
public:
  TagBuilder(std::string tag_name, FunctionPtr attributes_fn, FunctionPtr content_fn);

  [[nodiscard]] const std::string & tag_name() const noexcept { return tag_name_; }

  [[nodiscard]] html::Fragment render(const RenderDict & dict) const;

private:
  std::string tag_name_;
  FunctionPtr attributes_fn_;
  FunctionPtr content_fn_;
};

class DelegateBuilder final : public BuilderBase<DelegateBuilder, BuilderKind::Delegate>
{
public:
  DelegateBuilder(FragmentSource source, std::optional<std::string> name);

  [[nodiscard]] const std::optional<std::string> & name() const noexcept { return name_; }

  /// @throws InvalidFragmentError if the source returns an invalid fragment
  [[nodiscard]] html::Fragment render(const RenderDict & dict) const;

private:
  FragmentSource source_;
  std::optional<std::string> name_;
};

// ============================================================================
// Factories
// ============================================================================

[[nodiscard]] BuilderPtr make_const(html::Fragment content);

/// Constant raw text.
[[nodiscard]] BuilderPtr make_text(std::string text);

[[nodiscard]] BuilderPtr make_combined(BuilderPtr left, BuilderPtr right);

[[nodiscard]] BuilderPtr make_tag(
  std::string tag_name, FunctionPtr attributes_fn, FunctionPtr content_fn);

[[nodiscard]] BuilderPtr make_delegate(
  FragmentSource source, std::optional<std::string> name = std::nullopt);

/// Delegate to any object providing `get_fragment(dict, name)`.
template <typename T>
[[nodiscard]] BuilderPtr make_delegate(
  std::shared_ptr<const T> target, std::optional<std::string> name = std::nullopt)
{
  return make_delegate(
    [target = std::move(target)](
      const RenderDict & dict, const std::optional<std::string> & field_name) {
      return target->get_fragment(dict, field_name);
    },
    std::move(name));
}

}  // namespace formlets
