#pragma once

#include <string>

#include "cli_args.h"

namespace xmlnav::cli {

/// Effective settings after defaults, the configuration file and CLI flags are merged.
struct NavigatorSettings {
  int page_size = 10;
  int poll_timeout_ms = 200;
  int fetch_timeout_ms = 5000;
  bool color = true;
  int attribute_preview_chars = 40;
};

/// Resolves the configuration path: explicit path, then XMLNAV_CONFIG, then
/// $XDG_CONFIG_HOME/xmlnav/config.json, then $HOME/.config/xmlnav/config.json.
/// Returns an empty string when no candidate can be formed.
std::string resolve_config_path(const std::string& explicit_path);

/// Parses a JSON configuration document into `settings`.
/// MUST leave `settings` untouched and return false with a message on any error
/// (syntax, non-object root, wrong type, out-of-range value). Unknown keys are ignored.
bool parse_config_json(const std::string& text, NavigatorSettings& settings, std::string& error);

/// Loads the configuration file at `path` into `settings`.
/// A missing file is not an error unless `required`; returns false with a message otherwise.
bool load_config(const std::string& path,
                 bool required,
                 NavigatorSettings& settings,
                 std::string& error);

/// Overrides settings with the flags present on the command line.
void apply_cli_overrides(const CliOptions& options, NavigatorSettings& settings);

}  // namespace xmlnav::cli
