// formlets/project/form_config.cpp - Form description loading
//
#include "formlets/project/form_config.hpp"

#include <yaml-cpp/yaml.h>

#include <set>

#include "formlets/form/form.hpp"

namespace formlets
{

namespace
{

std::optional<FieldType> parse_field_type(const std::string & text)
{
  if (text == "text") return FieldType::Text;
  if (text == "integer") return FieldType::Integer;
  return std::nullopt;
}

/// Parse a single field entry
std::optional<FieldConfig> parse_field(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "field entry must be a map";
    return std::nullopt;
  }

  FieldConfig field;

  if (!node["name"]) {
    error = "field must have a 'name'";
    return std::nullopt;
  }
  field.name = node["name"].as<std::string>();
  if (field.name.empty()) {
    error = "field name must not be empty";
    return std::nullopt;
  }

  field.label = node["label"] ? node["label"].as<std::string>() : field.name;

  if (node["type"]) {
    const auto type_name = node["type"].as<std::string>();
    const auto type = parse_field_type(type_name);
    if (!type) {
      error = "field '" + field.name + "': invalid type '" + type_name +
              "' (must be 'text' or 'integer')";
      return std::nullopt;
    }
    field.type = *type;
  }

  if (node["min_length"]) {
    if (field.type != FieldType::Text) {
      error = "field '" + field.name + "': 'min_length' only applies to text fields";
      return std::nullopt;
    }
    field.min_length = node["min_length"].as<std::size_t>();
  }

  if ((node["min"] || node["max"]) && field.type != FieldType::Integer) {
    error = "field '" + field.name + "': 'min' and 'max' only apply to integer fields";
    return std::nullopt;
  }
  if (node["min"]) {
    field.min = node["min"].as<int64_t>();
  }
  if (node["max"]) {
    field.max = node["max"].as<int64_t>();
  }

  if (field.min && field.max && *field.min > *field.max) {
    error = "field '" + field.name + "': 'min' is greater than 'max'";
    return std::nullopt;
  }

  return field;
}

FormConfigLoadResult parse_root(const YAML::Node & root)
{
  FormConfig config;

  // Parse 'form' section
  if (!root["form"] || !root["form"].IsMap()) {
    return FormConfigLoadResult::fail("missing 'form' section");
  }
  const auto & form = root["form"];
  if (!form["id"]) {
    return FormConfigLoadResult::fail("form.id is required");
  }
  config.form.id = form["id"].as<std::string>();
  if (!is_valid_form_id(config.form.id)) {
    return FormConfigLoadResult::fail(
      "invalid form.id: '" + config.form.id + "' (only letters, digits and '_' allowed)");
  }
  config.form.action = form["action"] ? form["action"].as<std::string>() : "";
  if (form["attributes"]) {
    if (!form["attributes"].IsMap()) {
      return FormConfigLoadResult::fail("form.attributes must be a map");
    }
    for (const auto & attr : form["attributes"]) {
      config.form.attributes.push_back(
        {attr.first.as<std::string>(), attr.second.as<std::string>()});
    }
  }

  // Parse 'fields' section
  if (!root["fields"] || !root["fields"].IsSequence()) {
    return FormConfigLoadResult::fail("fields must be a list");
  }
  std::set<std::string> names;
  for (const auto & field_node : root["fields"]) {
    std::string field_error;
    auto field = parse_field(field_node, field_error);
    if (!field) {
      return FormConfigLoadResult::fail("invalid field: " + field_error);
    }
    if (!names.insert(field->name).second) {
      return FormConfigLoadResult::fail("duplicate field name: '" + field->name + "'");
    }
    config.fields.push_back(std::move(*field));
  }
  if (config.fields.empty()) {
    return FormConfigLoadResult::fail("a form needs at least one field");
  }

  return FormConfigLoadResult::ok(std::move(config));
}

}  // namespace

FormConfigLoadResult load_form_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return FormConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return FormConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  FormConfigLoadResult result;
  try {
    result = parse_root(root);
  } catch (const YAML::Exception & e) {
    return FormConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
  if (result.success) {
    result.config.config_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

FormConfigLoadResult load_form_config_from_string(const std::string & yaml)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception & e) {
    return FormConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root);
  } catch (const YAML::Exception & e) {
    return FormConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_form_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_form_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

const char * to_string(FieldType type) noexcept
{
  switch (type) {
    case FieldType::Text:
      return "text";
    case FieldType::Integer:
      return "integer";
  }
  return "unknown";
}

}  // namespace formlets
