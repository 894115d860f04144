#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace xmlnav {

/// Element census for one nesting depth (0 = root level).
struct DepthStats {
  size_t depth = 0;
  size_t element_count = 0;
  /// Distinct tag names at this depth, sorted ascending, borrowed from the buffer.
  std::vector<std::string_view> unique_tags;
};

/// One-pass census of a document's tokens.
/// Borrows tag names from the scanned buffer; MUST NOT outlive it.
struct DocumentStats {
  size_t byte_size = 0;
  size_t element_count = 0;
  /// StartTag plus EndTag events.
  size_t tag_count = 0;
  size_t text_run_count = 0;
  size_t max_depth = 0;
  /// Only depths with at least one element, ascending.
  std::vector<DepthStats> levels;
};

/// Tokenizes `xml` once and collects the census.
/// MUST NOT underflow depth on stray end tags and MUST NOT touch any explorer cache.
DocumentStats collect_stats(std::string_view xml);

/// Renders the human-readable report.
/// `elapsed_ms` is the wall time spent collecting; colour uses ANSI escapes.
std::string render_stats_text(const DocumentStats& stats, double elapsed_ms, bool color);

/// Serializes the report as a JSON object with the same fields plus `elapsed_ms`.
nlohmann::json stats_to_json(const DocumentStats& stats, double elapsed_ms);

}  // namespace xmlnav
