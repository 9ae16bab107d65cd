// ui_markup/project/markup_config.hpp - Markup configuration (uimc.yaml)
//
// Parses and validates uimc.yaml configuration files.
// The defaults reproduce the stock toolkit conventions, so a missing file is
// never an error.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ui_markup
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Names of the toolkit entry points the generated code calls.
 */
struct ToolkitConfig
{
  /// Primitives constructed as `name()`
  std::vector<std::string> native_tags = {"div", "svg", "anchored"};

  /// Reserved head that wraps its single child
  std::string deferred_tag = "deferred";

  /// Implicit component constructor: `Path::new()`
  std::string constructor = "new";

  /// Attach a single child: `.child(x)`
  std::string attach_one = "child";

  /// Attach a collection: `.children(xs)`
  std::string attach_many = "children";

  /// Type erasure applied inside the deferred wrapper
  std::string erase = "into_any_element";

  /// Deferred wrapper function
  std::string defer = "deferred";

  [[nodiscard]] bool is_native_tag(std::string_view name) const;
};

/**
 * Head classification rules.
 */
struct SyntaxConfig
{
  /// ECMAScript regex tested against the final path segment of a head
  std::string component_pattern = "^[A-Z]";

  /// Reject lowercase single-identifier heads outside the native allow-list
  bool strict_native_tags = false;
};

enum class OutputStyle : uint8_t {
  Compact,  // one line
  Pretty,   // one chain link per line
};

struct OutputConfig
{
  OutputStyle style = OutputStyle::Compact;
  uint32_t indent_width = 4;
};

/**
 * Complete configuration (uimc.yaml).
 */
struct MarkupConfig
{
  /// Name of the host macro whose invocations are expanded: `ui! { ... }`
  std::string macro_name = "ui";

  ToolkitConfig toolkit;
  SyntaxConfig syntax;
  OutputConfig output;

  /// Directory containing uimc.yaml (empty for built-in defaults)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  MarkupConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(MarkupConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a uimc.yaml file.
 *
 * Keys that are absent keep their defaults.
 *
 * @param config_path Path to uimc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_markup_config(const std::filesystem::path & config_path);

/**
 * Load a configuration from YAML text.
 */
[[nodiscard]] ConfigLoadResult load_markup_config_from_string(std::string_view yaml_text);

/**
 * Check a configuration for values the engine cannot work with.
 *
 * @return Error message, or std::nullopt when the configuration is usable
 */
[[nodiscard]] std::optional<std::string> validate_markup_config(const MarkupConfig & config);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to uimc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_markup_config(
  const std::filesystem::path & start_dir);

/**
 * YAML text of the default configuration, as written by `uimc init`.
 */
[[nodiscard]] std::string default_config_yaml();

[[nodiscard]] std::string_view to_string(OutputStyle style) noexcept;

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_markup_config_file_name = "uimc.yaml";

}  // namespace ui_markup
