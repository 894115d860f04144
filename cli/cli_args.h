#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace xmlnav::cli {

enum class RunMode {
  Navigate,
  Stats,
  Check,
};

/// Parsed command line. Optional fields are unset when the flag was not given so
/// that configuration file values can fill them.
struct CliOptions {
  RunMode mode = RunMode::Navigate;
  std::string input;
  std::string stats_format = "text";
  std::string config_path;
  std::optional<int> page_size;
  std::optional<int> poll_timeout_ms;
  std::optional<int> fetch_timeout_ms;
  bool color = true;
  bool show_help = false;
  bool show_version = false;
};

/// Prints usage, modes, keybindings and exit codes.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
void print_help(std::ostream& os);

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false with a message for invalid flags, values or combinations.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace xmlnav::cli
