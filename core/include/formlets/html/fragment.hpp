// formlets/html/fragment.hpp - Minimal HTML fragment model
//
// Builders produce fragments; fragments only know how to nest, concatenate
// and render themselves to a string. Literal text is emitted verbatim.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace formlets::html
{

struct Attribute
{
  std::string key;
  std::string value;
};

using Attributes = std::vector<Attribute>;

enum class FragmentKind : uint8_t {
  Invalid,   ///< Default constructed; not renderable
  Literal,   ///< Raw text
  Tag,       ///< Element with attributes and optional content
  Sequence,  ///< Concatenation of fragments
};

class Fragment
{
public:
  /// Creates an invalid fragment.
  Fragment() = default;

  [[nodiscard]] static Fragment literal(std::string text);

  /// Literal with `&`, `<` and `>` replaced by entities, for text that may
  /// contain user input.
  [[nodiscard]] static Fragment escaped(const std::string & text);

  /**
   * Element `<name attrs>content</name>`. Without content the element is
   * rendered self-closing (`<name attrs/>`).
   */
  [[nodiscard]] static Fragment tag(
    std::string name, Attributes attributes, std::optional<Fragment> content = std::nullopt);

  /// This fragment followed by `other`. Nested sequences are flattened.
  [[nodiscard]] Fragment concat(const Fragment & other) const;

  [[nodiscard]] FragmentKind kind() const noexcept { return kind_; }

  /// Literal text or tag name.
  [[nodiscard]] const std::string & text() const noexcept { return text_; }

  [[nodiscard]] const Attributes & attributes() const noexcept { return attributes_; }

  /// Tag content (at most one) or sequence parts.
  [[nodiscard]] const std::vector<Fragment> & children() const noexcept { return children_; }

  /// Structural check: this fragment and everything below it can be rendered.
  [[nodiscard]] bool is_valid() const noexcept;

  /// @throws InvalidFragmentError if the fragment is not valid
  [[nodiscard]] std::string render() const;

private:
  void render_into(std::string & out) const;

  FragmentKind kind_ = FragmentKind::Invalid;
  std::string text_;
  Attributes attributes_;
  std::vector<Fragment> children_;
};

/// Value of the first attribute named `key`, if present.
[[nodiscard]] std::optional<std::string> find_attribute(
  const Attributes & attributes, const std::string & key);

}  // namespace formlets::html
