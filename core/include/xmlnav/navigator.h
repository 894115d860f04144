#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xmlnav/attributes.h"
#include "xmlnav/explorer.h"

namespace xmlnav {

/// Navigation commands delivered by the host input layer.
enum class NavCommand {
  MoveDown,
  MoveUp,
  PageDown,
  PageUp,
  JumpFirst,
  JumpLast,
  Descend,
  Ascend,
  ToggleDetail,
  Quit,
};

/// One frame of the navigation stack: the children of an entered element.
/// `tag` is empty only for the synthetic root level.
struct Level {
  std::optional<std::string_view> tag;
  std::vector<Node> children;
  size_t last_selected = 0;
};

/// Attributes and child count fetched for the selected node while the detail view is open.
struct NodeDetail {
  size_t node_offset = 0;
  std::vector<Attribute> attributes;
  size_t child_count = 0;
};

/// One row of the level listing handed to the renderer.
struct ViewRow {
  std::string_view tag;
  std::optional<std::string_view> text;
  /// Whitespace-compacted raw attribute text, truncated with "..." when long.
  std::optional<std::string> attribute_preview;
};

/// Read-only per-frame snapshot of the navigation state.
struct ViewModel {
  std::optional<std::string_view> level_tag;
  /// Index in the level of `rows.front()`.
  size_t first_row = 0;
  std::vector<ViewRow> rows;
  size_t selected = 0;
  size_t child_count = 0;
  size_t depth = 0;
  bool detail_visible = false;
  std::vector<Attribute> detail_attributes;
  size_t detail_child_count = 0;
};

/// Depth-first, one-level-at-a-time navigation over an Explorer.
/// MUST keep the stack non-empty and the selection within the current level at all times;
/// every transition is a safe no-op when it cannot apply.
class Navigator {
 public:
  static constexpr size_t kDefaultPageSize = 10;
  static constexpr size_t kDefaultPreviewChars = 40;

  /// Builds the synthetic root level holding the document element (or nothing).
  /// MUST NOT outlive `explorer`.
  explicit Navigator(Explorer& explorer, size_t page_size = kDefaultPageSize);

  void move_down();
  void move_up();
  void page_down();
  void page_up();
  void jump_first();
  void jump_last();

  /// Pushes the children of the selected node and resets the selection to 0.
  /// The level left behind remembers the selection it had.
  void descend();
  /// Pops one level and restores the parent's remembered selection.
  /// No-op at the root level.
  void ascend();
  /// Opens the detail view for the selected node, or closes it and drops the data.
  void toggle_detail();

  /// Applies one command. Returns false when the command was Quit.
  bool apply(NavCommand command);

  /// Page size used by PageUp/PageDown; values below 1 are treated as 1.
  void set_page_size(size_t page_size);
  size_t page_size() const { return page_size_; }

  void set_preview_chars(size_t chars) { preview_chars_ = chars; }

  size_t selected() const { return selected_; }
  /// Number of completed descents.
  size_t depth() const { return stack_.size() - 1; }
  const Level& current_level() const { return stack_.back(); }
  const std::vector<Level>& stack() const { return stack_; }
  /// Selected node of the current level, or nullptr when the level is empty.
  const Node* selected_node() const;
  bool detail_visible() const { return detail_.has_value(); }
  const std::optional<NodeDetail>& detail() const { return detail_; }

  /// Builds the renderer snapshot for the current state.
  /// Only rows in [first_row, first_row + max_rows) are materialized.
  ViewModel view(size_t first_row = 0, size_t max_rows = static_cast<size_t>(-1)) const;

 private:
  void select(size_t index);
  NodeDetail fetch_detail(const Node& node);

  Explorer& explorer_;
  std::vector<Level> stack_;
  size_t selected_ = 0;
  size_t page_size_ = kDefaultPageSize;
  size_t preview_chars_ = kDefaultPreviewChars;
  std::optional<NodeDetail> detail_;
};

/// Builds the one-line attribute preview for a row: whitespace runs collapse to one
/// space, the ends are trimmed, and text longer than `max_chars` code points is cut
/// with "...". Returns nullopt when nothing remains.
std::optional<std::string> make_attribute_preview(std::string_view raw_attributes,
                                                  size_t max_chars);

}  // namespace xmlnav
