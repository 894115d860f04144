#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace xmlnav::cli {

namespace {

using json = nlohmann::json;

std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string();
}

bool read_int(const json& doc,
              const char* key,
              int min_value,
              int max_value,
              int& out,
              std::string& error) {
  auto it = doc.find(key);
  if (it == doc.end()) return true;
  if (!it->is_number_integer()) {
    error = std::string("Config key '") + key + "' must be an integer";
    return false;
  }
  long long value = it->get<long long>();
  if (value < min_value || value > max_value) {
    error = std::string("Config key '") + key + "' out of range [" + std::to_string(min_value) +
            ", " + std::to_string(max_value) + "]";
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

}  // namespace

std::string resolve_config_path(const std::string& explicit_path) {
  if (!explicit_path.empty()) return explicit_path;
  std::string env = env_or_empty("XMLNAV_CONFIG");
  if (!env.empty()) return env;
  std::string xdg = env_or_empty("XDG_CONFIG_HOME");
  if (!xdg.empty()) return (std::filesystem::path(xdg) / "xmlnav" / "config.json").string();
  std::string home = env_or_empty("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "xmlnav" / "config.json").string();
  }
  return "";
}

bool parse_config_json(const std::string& text, NavigatorSettings& settings, std::string& error) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    error = "Config is not valid JSON";
    return false;
  }
  if (!doc.is_object()) {
    error = "Config root must be a JSON object";
    return false;
  }
  NavigatorSettings parsed = settings;
  if (!read_int(doc, "page_size", 1, 100000, parsed.page_size, error)) return false;
  if (!read_int(doc, "poll_timeout_ms", 10, 5000, parsed.poll_timeout_ms, error)) return false;
  if (!read_int(doc, "fetch_timeout_ms", 0, 3600000, parsed.fetch_timeout_ms, error)) return false;
  if (!read_int(doc, "attribute_preview_chars", 0, 10000, parsed.attribute_preview_chars, error)) {
    return false;
  }
  auto color = doc.find("color");
  if (color != doc.end()) {
    if (!color->is_boolean()) {
      error = "Config key 'color' must be a boolean";
      return false;
    }
    parsed.color = color->get<bool>();
  }
  settings = parsed;
  return true;
}

bool load_config(const std::string& path,
                 bool required,
                 NavigatorSettings& settings,
                 std::string& error) {
  if (path.empty()) return true;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (!required) return true;
    error = "Config file not found: " + path;
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "Failed to open config file: " + path;
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (!parse_config_json(buffer.str(), settings, error)) {
    error += " (" + path + ")";
    return false;
  }
  return true;
}

void apply_cli_overrides(const CliOptions& options, NavigatorSettings& settings) {
  if (options.page_size.has_value()) settings.page_size = *options.page_size;
  if (options.poll_timeout_ms.has_value()) settings.poll_timeout_ms = *options.poll_timeout_ms;
  if (options.fetch_timeout_ms.has_value()) settings.fetch_timeout_ms = *options.fetch_timeout_ms;
  if (!options.color) settings.color = false;
}

}  // namespace xmlnav::cli
