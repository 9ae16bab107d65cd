// ui_markup/project/markup_config.cpp - Markup configuration implementation
//
#include "ui_markup/project/markup_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace ui_markup
{

namespace
{

bool is_identifier(std::string_view s)
{
  if (s.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(s.front());
  if (!(std::isalpha(first) != 0 || first == '_')) {
    return false;
  }
  return std::all_of(s.begin(), s.end(), [](char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || u == '_';
  });
}

/// Read an optional string key into `out`.
void read_string(const YAML::Node & section, const char * key, std::string & out)
{
  if (section[key]) {
    out = section[key].as<std::string>();
  }
}

/// Fill `config` from a parsed document. Returns an error message on failure.
std::optional<std::string> parse_config_node(const YAML::Node & root, MarkupConfig & config)
{
  if (root.IsNull()) {
    return std::nullopt;
  }
  if (!root.IsMap()) {
    return std::string("configuration root must be a map");
  }

  read_string(root, "macro", config.macro_name);

  // Parse 'toolkit' section
  if (root["toolkit"]) {
    const auto & tk = root["toolkit"];
    if (!tk.IsMap()) {
      return std::string("toolkit must be a map");
    }

    if (tk["native_tags"]) {
      if (!tk["native_tags"].IsSequence()) {
        return std::string("toolkit.native_tags must be a list");
      }
      config.toolkit.native_tags.clear();
      for (const auto & tag : tk["native_tags"]) {
        config.toolkit.native_tags.push_back(tag.as<std::string>());
      }
    }

    read_string(tk, "deferred_tag", config.toolkit.deferred_tag);
    read_string(tk, "constructor", config.toolkit.constructor);
    read_string(tk, "attach_one", config.toolkit.attach_one);
    read_string(tk, "attach_many", config.toolkit.attach_many);
    read_string(tk, "erase", config.toolkit.erase);
    read_string(tk, "defer", config.toolkit.defer);
  }

  // Parse 'syntax' section
  if (root["syntax"]) {
    const auto & syn = root["syntax"];
    if (!syn.IsMap()) {
      return std::string("syntax must be a map");
    }
    read_string(syn, "component_pattern", config.syntax.component_pattern);
    if (syn["strict_native_tags"]) {
      config.syntax.strict_native_tags = syn["strict_native_tags"].as<bool>();
    }
  }

  // Parse 'output' section
  if (root["output"]) {
    const auto & out = root["output"];
    if (!out.IsMap()) {
      return std::string("output must be a map");
    }
    if (out["style"]) {
      const auto style = out["style"].as<std::string>();
      if (style == "compact") {
        config.output.style = OutputStyle::Compact;
      } else if (style == "pretty") {
        config.output.style = OutputStyle::Pretty;
      } else {
        return "invalid output.style: '" + style + "' (must be 'compact' or 'pretty')";
      }
    }
    if (out["indent_width"]) {
      const int width = out["indent_width"].as<int>();
      if (width < 0 || width > 16) {
        return "invalid output.indent_width: " + std::to_string(width) + " (must be 0..16)";
      }
      config.output.indent_width = static_cast<uint32_t>(width);
    }
  }

  return validate_markup_config(config);
}

}  // namespace

bool ToolkitConfig::is_native_tag(std::string_view name) const
{
  return std::find(native_tags.begin(), native_tags.end(), name) != native_tags.end();
}

std::string_view to_string(OutputStyle style) noexcept
{
  switch (style) {
    case OutputStyle::Compact:
      return "compact";
    case OutputStyle::Pretty:
      return "pretty";
  }
  return "";
}

std::optional<std::string> validate_markup_config(const MarkupConfig & config)
{
  if (!is_identifier(config.macro_name)) {
    return "invalid macro name: '" + config.macro_name + "'";
  }

  for (const auto & tag : config.toolkit.native_tags) {
    if (!is_identifier(tag)) {
      return "invalid entry in toolkit.native_tags: '" + tag + "'";
    }
  }

  const std::pair<const char *, const std::string *> names[] = {
    {"toolkit.deferred_tag", &config.toolkit.deferred_tag},
    {"toolkit.constructor", &config.toolkit.constructor},
    {"toolkit.attach_one", &config.toolkit.attach_one},
    {"toolkit.attach_many", &config.toolkit.attach_many},
    {"toolkit.erase", &config.toolkit.erase},
    {"toolkit.defer", &config.toolkit.defer},
  };
  for (const auto & [key, value] : names) {
    if (!is_identifier(*value)) {
      return std::string("invalid ") + key + ": '" + *value + "' (must be an identifier)";
    }
  }

  if (config.toolkit.is_native_tag(config.toolkit.deferred_tag)) {
    return "toolkit.deferred_tag '" + config.toolkit.deferred_tag +
           "' must not also be listed in toolkit.native_tags";
  }

  try {
    const std::regex re(config.syntax.component_pattern, std::regex::ECMAScript);
    (void)re;
  } catch (const std::regex_error & e) {
    return "invalid syntax.component_pattern '" + config.syntax.component_pattern +
           "': " + e.what();
  }

  return std::nullopt;
}

ConfigLoadResult load_markup_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  MarkupConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    if (auto err = parse_config_node(root, config)) {
      return ConfigLoadResult::fail(config_path.string() + ": " + *err);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_markup_config_from_string(std::string_view yaml_text)
{
  MarkupConfig config;
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_text));
    if (auto err = parse_config_node(root, config)) {
      return ConfigLoadResult::fail(*err);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_markup_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_markup_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_config_yaml()
{
  const MarkupConfig defaults;

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "macro" << YAML::Value << defaults.macro_name;

  out << YAML::Key << "toolkit" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "native_tags" << YAML::Value << YAML::Flow << defaults.toolkit.native_tags;
  out << YAML::Key << "deferred_tag" << YAML::Value << defaults.toolkit.deferred_tag;
  out << YAML::Key << "constructor" << YAML::Value << defaults.toolkit.constructor;
  out << YAML::Key << "attach_one" << YAML::Value << defaults.toolkit.attach_one;
  out << YAML::Key << "attach_many" << YAML::Value << defaults.toolkit.attach_many;
  out << YAML::Key << "erase" << YAML::Value << defaults.toolkit.erase;
  out << YAML::Key << "defer" << YAML::Value << defaults.toolkit.defer;
  out << YAML::EndMap;

  out << YAML::Key << "syntax" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "component_pattern" << YAML::Value << YAML::DoubleQuoted
      << defaults.syntax.component_pattern;
  out << YAML::Key << "strict_native_tags" << YAML::Value << defaults.syntax.strict_native_tags;
  out << YAML::EndMap;

  out << YAML::Key << "output" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "style" << YAML::Value << std::string(to_string(defaults.output.style));
  out << YAML::Key << "indent_width" << YAML::Value << defaults.output.indent_width;
  out << YAML::EndMap;

  out << YAML::EndMap;

  return std::string(out.c_str()) + "\n";
}

}  // namespace ui_markup
