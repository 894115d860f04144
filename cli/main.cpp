#include <unistd.h>

#include <chrono>
#include <iostream>
#include <string>

#include "cli_args.h"
#include "config.h"
#include "navigate/navigator_session.h"
#include "ui/color.h"
#include "xmlnav/source.h"
#include "xmlnav/stats.h"
#include "xmlnav/version.h"
#include "xmlnav/wellformed.h"

using namespace xmlnav::cli;

namespace {

int run_stats(const CliOptions& options, const NavigatorSettings& settings) {
  xmlnav::SourceBuffer source;
  try {
    source = xmlnav::load_source(options.input, settings.fetch_timeout_ms);
  } catch (const xmlnav::SourceError& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }
  const auto started = std::chrono::steady_clock::now();
  xmlnav::DocumentStats stats = xmlnav::collect_stats(source.view());
  const double elapsed_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  if (options.stats_format == "json") {
    std::cout << xmlnav::stats_to_json(stats, elapsed_ms).dump(2) << std::endl;
  } else {
    const bool color = settings.color && isatty(STDOUT_FILENO);
    std::cout << xmlnav::render_stats_text(stats, elapsed_ms, color);
  }
  return 0;
}

int run_check(const CliOptions& options, const NavigatorSettings& settings) {
  xmlnav::SourceBuffer source;
  try {
    source = xmlnav::load_source(options.input, settings.fetch_timeout_ms);
  } catch (const xmlnav::SourceError& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return 2;
  }
  xmlnav::WellFormedReport report = xmlnav::check_well_formed(source.view());
  if (report.ok) {
    std::cout << options.input << ": " << xmlnav::format_well_formed_report(report) << std::endl;
    return 0;
  }
  std::cerr << "Error: " << options.input << ": " << xmlnav::format_well_formed_report(report)
            << std::endl;
  return 1;
}

}  // namespace

/// Entry point that parses CLI options and dispatches to navigation, stats or check.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "xmlnav " << xmlnav::version_string() << std::endl;
    return 0;
  }

  NavigatorSettings settings;
  std::string config_error;
  const std::string config_path = resolve_config_path(options.config_path);
  if (!load_config(config_path, !options.config_path.empty(), settings, config_error)) {
    if (!options.config_path.empty()) {
      std::cerr << "Error: " << config_error << std::endl;
      return 2;
    }
    // A broken implicit config falls back to defaults rather than blocking the session.
    const bool color = options.color && isatty(STDERR_FILENO);
    std::cerr << (color ? kColor.yellow : "") << "Warning: " << (color ? kColor.reset : "")
              << config_error << " (using defaults)" << std::endl;
  }
  apply_cli_overrides(options, settings);

  switch (options.mode) {
    case RunMode::Stats:
      return run_stats(options, settings);
    case RunMode::Check:
      return run_check(options, settings);
    case RunMode::Navigate:
      return run_navigator(options.input, settings, std::cerr);
  }
  return 2;
}
