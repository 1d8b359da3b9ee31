// formlets/html/fragment.cpp - HTML fragment rendering
//
#include "formlets/html/fragment.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "formlets/basic/errors.hpp"

namespace formlets::html
{

namespace
{

[[nodiscard]] std::string quote_attribute(const std::string & value)
{
  std::string escaped;
  escaped.reserve(value.size());
  for (const char c : value) {
    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

[[nodiscard]] std::string escape_text(const std::string & text)
{
  std::string escaped;
  escaped.reserve(text.size());
  for (const char c : text) {
    switch (c) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      default:
        escaped.push_back(c);
    }
  }
  return escaped;
}

}  // namespace

Fragment Fragment::escaped(const std::string & text) { return literal(escape_text(text)); }

Fragment Fragment::literal(std::string text)
{
  Fragment f;
  f.kind_ = FragmentKind::Literal;
  f.text_ = std::move(text);
  return f;
}

Fragment Fragment::tag(std::string name, Attributes attributes, std::optional<Fragment> content)
{
  Fragment f;
  f.kind_ = FragmentKind::Tag;
  f.text_ = std::move(name);
  f.attributes_ = std::move(attributes);
  if (content) {
    f.children_.push_back(std::move(*content));
  }
  return f;
}

Fragment Fragment::concat(const Fragment & other) const
{
  Fragment f;
  f.kind_ = FragmentKind::Sequence;
  for (const Fragment * part : {this, &other}) {
    if (part->kind_ == FragmentKind::Sequence) {
      f.children_.insert(f.children_.end(), part->children_.begin(), part->children_.end());
    } else {
      f.children_.push_back(*part);
    }
  }
  return f;
}

bool Fragment::is_valid() const noexcept
{
  switch (kind_) {
    case FragmentKind::Invalid:
      return false;
    case FragmentKind::Literal:
      return true;
    case FragmentKind::Tag:
      if (text_.empty() || children_.size() > 1) return false;
      break;
    case FragmentKind::Sequence:
      break;
  }
  return std::all_of(
    children_.begin(), children_.end(), [](const Fragment & c) { return c.is_valid(); });
}

std::string Fragment::render() const
{
  if (!is_valid()) {
    throw InvalidFragmentError("can't render an invalid fragment");
  }
  std::string out;
  render_into(out);
  return out;
}

void Fragment::render_into(std::string & out) const
{
  switch (kind_) {
    case FragmentKind::Invalid:
      return;
    case FragmentKind::Literal:
      out += text_;
      return;
    case FragmentKind::Tag:
      out += "<" + text_;
      for (const auto & attr : attributes_) {
        out += fmt::format(" {}=\"{}\"", attr.key, quote_attribute(attr.value));
      }
      if (children_.empty()) {
        out += "/>";
        return;
      }
      out += ">";
      children_.front().render_into(out);
      out += "</" + text_ + ">";
      return;
    case FragmentKind::Sequence:
      for (const auto & child : children_) {
        child.render_into(out);
      }
      return;
  }
}

std::optional<std::string> find_attribute(const Attributes & attributes, const std::string & key)
{
  const auto it = std::find_if(
    attributes.begin(), attributes.end(), [&](const Attribute & a) { return a.key == key; });
  if (it == attributes.end()) {
    return std::nullopt;
  }
  return it->value;
}

}  // namespace formlets::html
