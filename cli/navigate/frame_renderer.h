#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "xmlnav/navigator.h"

namespace xmlnav::cli {

struct FrameSize {
  size_t width = 80;
  size_t height = 24;
};

/// Rows used by the detail panel for a frame, 0 when the panel is hidden.
/// MUST leave at least half of the frame to the child list.
size_t detail_panel_rows(const FrameSize& size, bool detail_visible, size_t attribute_count);

/// Rows available to the child list once borders, help line and detail panel are placed.
/// Always at least 1.
size_t list_body_rows(const FrameSize& size, size_t detail_rows);

/// Returns the first visible row so that `selected` stays on screen.
/// MUST keep the previous scroll position when the selection is already visible.
size_t scroll_for_selection(size_t scroll_top, size_t selected, size_t body_rows, size_t count);

/// Renders one frame as exactly `size.height` lines (fewer only for degenerate sizes).
/// `view.rows` MUST start at `view.first_row` and hold at most the list body rows.
/// Pure function of its inputs; colour adds ANSI escapes that do not count toward width.
std::vector<std::string> render_frame_lines(const ViewModel& view, const FrameSize& size, bool color);

/// Title text for the current level, e.g. "<book>  [2/7]" or "Root element  [1/1]".
std::string level_title(const ViewModel& view);

}  // namespace xmlnav::cli
