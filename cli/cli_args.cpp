#include "cli_args.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

namespace xmlnav::cli {

namespace {

bool parse_int_value(const std::string& flag,
                     const std::string& text,
                     int min_value,
                     std::optional<int>& out,
                     std::string& error) {
  if (text.empty()) {
    error = "Invalid " + flag + " value (expected integer)";
    return false;
  }
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' ||
      value > std::numeric_limits<int>::max()) {
    error = "Invalid " + flag + " value (expected integer): " + text;
    return false;
  }
  if (value < min_value) {
    error = "Invalid " + flag + " value (must be >= " + std::to_string(min_value) + "): " + text;
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

}  // namespace

void print_help(std::ostream& os) {
  os << "xmlnav - lazy navigator for large XML documents\n\n";
  os << "Usage:\n";
  os << "  xmlnav [options] <input>\n";
  os << "  xmlnav --stats <input> [--format text|json]\n";
  os << "  xmlnav --check <input>\n";
  os << "  xmlnav --help | --version\n\n";
  os << "<input> is a file path, - for stdin, or an http(s) URL.\n\n";
  os << "Options:\n";
  os << "  --config <path>       configuration file (JSON)\n";
  os << "  --page-size <n>       rows moved by PageUp/PageDown when the terminal height is unknown\n";
  os << "  --poll-ms <n>         input poll timeout between redraws\n";
  os << "  --timeout-ms <n>      URL fetch timeout (0 = none)\n";
  os << "  --color=disabled      disable ANSI colors\n\n";
  os << "Keybindings: Up/Down or k/j move, PageUp/PageDown page, Home/End or g/G jump,\n";
  os << "Enter/Right/l descend, Backspace/Left/h ascend, Space details, q quit.\n";
  os << "Exit codes: 0=success, 1=runtime/validation error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  bool stats = false;
  bool check = false;
  bool format_set = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_value = [&](std::string& out) {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "--stats") {
      stats = true;
    } else if (arg == "--check") {
      check = true;
    } else if (arg == "--format") {
      if (!next_value(value)) return false;
      parsed.stats_format = value;
      format_set = true;
    } else if (arg == "--config") {
      if (!next_value(value)) return false;
      parsed.config_path = value;
    } else if (arg == "--page-size") {
      if (!next_value(value) || !parse_int_value(arg, value, 1, parsed.page_size, error)) {
        return false;
      }
    } else if (arg == "--poll-ms") {
      if (!next_value(value) || !parse_int_value(arg, value, 10, parsed.poll_timeout_ms, error)) {
        return false;
      }
    } else if (arg == "--timeout-ms") {
      if (!next_value(value) || !parse_int_value(arg, value, 0, parsed.fetch_timeout_ms, error)) {
        return false;
      }
    } else if (arg == "--color=disabled") {
      parsed.color = false;
    } else if (arg == "--help" || arg == "-h") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (arg == "-" || arg.empty() || arg[0] != '-') {
      if (!parsed.input.empty()) {
        error = "Unexpected extra input: " + arg;
        return false;
      }
      parsed.input = arg;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (stats && check) {
    error = "--stats and --check are mutually exclusive";
    return false;
  }
  if (format_set && !stats) {
    error = "--format is only supported with --stats";
    return false;
  }
  if (parsed.stats_format != "text" && parsed.stats_format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  if (!parsed.show_help && !parsed.show_version && parsed.input.empty()) {
    error = "Missing input (file path, - or URL)";
    return false;
  }
  parsed.mode = stats ? RunMode::Stats : (check ? RunMode::Check : RunMode::Navigate);
  options = parsed;
  return true;
}

}  // namespace xmlnav::cli
