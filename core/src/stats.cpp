#include "xmlnav/stats.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include "xmlnav/tokenizer.h"

namespace xmlnav {

namespace {

constexpr const char* kBold = "\033[1m";
constexpr const char* kCyan = "\033[36m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kMagenta = "\033[35m";
constexpr const char* kReset = "\033[0m";

struct Palette {
  explicit Palette(bool enabled) : enabled(enabled) {}
  const char* operator()(const char* code) const { return enabled ? code : ""; }
  bool enabled;
};

double megabytes_per_second(size_t bytes, double elapsed_ms) {
  if (elapsed_ms <= 0.0) return 0.0;
  return static_cast<double>(bytes) / (elapsed_ms / 1000.0) / 1000000.0;
}

std::string join_tags(const std::vector<std::string_view>& tags) {
  std::string out;
  for (size_t i = 0; i < tags.size(); ++i) {
    if (i > 0) out += ", ";
    out.append(tags[i].data(), tags[i].size());
  }
  return out;
}

}  // namespace

DocumentStats collect_stats(std::string_view xml) {
  DocumentStats stats;
  stats.byte_size = xml.size();
  std::vector<size_t> counts;
  std::vector<std::unordered_set<std::string_view>> names;
  size_t depth = 0;

  scan(xml, [&](const Token& token) {
    switch (token.kind) {
      case TokenKind::StartTag:
        if (counts.size() <= depth) {
          counts.resize(depth + 1, 0);
          names.resize(depth + 1);
        }
        ++counts[depth];
        names[depth].insert(token.name);
        ++depth;
        stats.max_depth = std::max(stats.max_depth, depth);
        ++stats.element_count;
        ++stats.tag_count;
        break;
      case TokenKind::EndTag:
        if (depth > 0) --depth;
        ++stats.tag_count;
        break;
      case TokenKind::Text:
        ++stats.text_run_count;
        break;
    }
    return ScanControl::Continue;
  });

  for (size_t d = 0; d < counts.size(); ++d) {
    if (counts[d] == 0) continue;
    DepthStats level;
    level.depth = d;
    level.element_count = counts[d];
    level.unique_tags.assign(names[d].begin(), names[d].end());
    std::sort(level.unique_tags.begin(), level.unique_tags.end());
    stats.levels.push_back(std::move(level));
  }
  return stats;
}

std::string render_stats_text(const DocumentStats& stats, double elapsed_ms, bool color) {
  Palette c(color);
  std::ostringstream out;
  out << c(kBold) << "--- XML Statistics ---" << c(kReset) << "\n";
  out << "Processed " << c(kYellow) << stats.tag_count << c(kReset) << " tags in " << c(kGreen)
      << std::fixed << std::setprecision(3) << elapsed_ms << " ms" << c(kReset) << "\n";
  out << "Elements: " << c(kYellow) << stats.element_count << c(kReset) << "\n";
  out << "Max depth: " << c(kYellow) << stats.max_depth << c(kReset) << "\n";
  out << "File size: " << c(kYellow) << stats.byte_size << c(kReset) << " bytes\n";
  out << "Processing speed: " << c(kGreen) << std::setprecision(2)
      << megabytes_per_second(stats.byte_size, elapsed_ms) << " MB/s" << c(kReset) << "\n";
  out << "\n" << c(kBold) << "--- Elements and unique tag names per depth level ---" << c(kReset)
      << "\n";
  for (const auto& level : stats.levels) {
    std::string label = level.depth == 0 ? "Root level" : "Depth " + std::to_string(level.depth);
    out << "  " << c(kCyan) << label << ": " << c(kReset) << c(kYellow) << level.element_count
        << c(kReset) << " elements\n";
    if (!level.unique_tags.empty()) {
      out << "    Unique tags: " << c(kMagenta) << join_tags(level.unique_tags) << c(kReset)
          << "\n";
    }
  }
  return out.str();
}

nlohmann::json stats_to_json(const DocumentStats& stats, double elapsed_ms) {
  nlohmann::json out;
  out["byte_size"] = stats.byte_size;
  out["element_count"] = stats.element_count;
  out["tag_count"] = stats.tag_count;
  out["text_run_count"] = stats.text_run_count;
  out["max_depth"] = stats.max_depth;
  out["elapsed_ms"] = elapsed_ms;
  nlohmann::json levels = nlohmann::json::array();
  for (const auto& level : stats.levels) {
    nlohmann::json tags = nlohmann::json::array();
    for (std::string_view tag : level.unique_tags) {
      tags.push_back(std::string(tag));
    }
    levels.push_back({
        {"depth", level.depth},
        {"element_count", level.element_count},
        {"unique_tags", std::move(tags)},
    });
  }
  out["levels"] = std::move(levels);
  return out;
}

}  // namespace xmlnav
