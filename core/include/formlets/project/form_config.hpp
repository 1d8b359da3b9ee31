// formlets/project/form_config.hpp - Form description (formlets.yaml)
//
// Parses and validates form description files used by the command line
// renderer and by tests.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "formlets/html/fragment.hpp"

namespace formlets
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class FieldType : uint8_t {
  Text,
  Integer,
};

/**
 * One input field.
 */
struct FieldConfig
{
  std::string name;
  std::string label;
  FieldType type = FieldType::Text;

  /// Text only: minimum length in bytes
  std::optional<std::size_t> min_length;

  /// Integer only: inclusive bounds
  std::optional<int64_t> min;
  std::optional<int64_t> max;
};

/**
 * The `form` section.
 */
struct FormSection
{
  std::string id;
  std::string action;
  html::Attributes attributes;
};

struct FormConfig
{
  FormSection form;
  std::vector<FieldConfig> fields;

  /// Directory containing the file (empty when parsed from a string)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct FormConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  FormConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static FormConfigLoadResult ok(FormConfig cfg)
  {
    FormConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static FormConfigLoadResult fail(std::string msg)
  {
    FormConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a form description from a file.
 *
 * @param config_path Path to formlets.yaml
 * @return FormConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] FormConfigLoadResult load_form_config(const std::filesystem::path & config_path);

/// Load a form description from YAML text.
[[nodiscard]] FormConfigLoadResult load_form_config_from_string(const std::string & yaml);

/**
 * Find formlets.yaml by searching upward from `start_dir`.
 *
 * @return Path to the file if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_form_config(
  const std::filesystem::path & start_dir);

[[nodiscard]] const char * to_string(FieldType type) noexcept;

/**
 * Default name of the form description file.
 */
inline constexpr const char * k_form_config_file_name = "formlets.yaml";

}  // namespace formlets
