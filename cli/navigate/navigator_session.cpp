#include "navigate/navigator_session.h"

#include <unistd.h>

#include <algorithm>
#include <iostream>

#include "input/terminal.h"
#include "navigate/frame_renderer.h"
#include "navigate/key_bindings.h"
#include "xmlnav/explorer.h"
#include "xmlnav/navigator.h"
#include "xmlnav/source.h"

namespace xmlnav::cli {

namespace {

constexpr size_t kFallbackHeight = 24;

/// Current frame size; `height_known` is false when the terminal did not report rows.
FrameSize current_frame_size(bool& height_known) {
  FrameSize size;
  size.width = static_cast<size_t>(std::max(terminal_width(), 8));
  const int rows = terminal_height();
  height_known = rows > 0;
  size.height = height_known ? static_cast<size_t>(std::max(rows, 4)) : kFallbackHeight;
  return size;
}

void draw_frame(const std::vector<std::string>& lines) {
  std::cout << "\033[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    std::cout << lines[i] << "\033[K";
    if (i + 1 < lines.size()) std::cout << "\r\n";
  }
  std::cout << "\033[J" << std::flush;
}

}  // namespace

int run_navigator(const std::string& input, const NavigatorSettings& settings, std::ostream& err) {
  if (input == "-") {
    err << "Error: navigation reads keys from stdin; pass a file path or URL instead of -"
        << std::endl;
    return 2;
  }
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    err << "Error: navigation requires an interactive terminal (use --stats or --check)."
        << std::endl;
    return 2;
  }

  SourceBuffer source;
  try {
    source = load_source(input, settings.fetch_timeout_ms);
  } catch (const SourceError& ex) {
    err << "Error: " << ex.what() << std::endl;
    return 2;
  }

  Explorer explorer(source.view());
  Navigator navigator(explorer, static_cast<size_t>(settings.page_size));
  navigator.set_preview_chars(static_cast<size_t>(settings.attribute_preview_chars));

  TermiosGuard guard;
  if (!guard.ok()) {
    err << "Error: failed to initialize terminal raw mode." << std::endl;
    return 1;
  }
  AlternateScreenGuard screen;

  size_t scroll_top = 0;
  bool running = true;
  bool dirty = true;
  FrameSize last_size;
  while (running) {
    bool height_known = false;
    const FrameSize size = current_frame_size(height_known);
    if (size.width != last_size.width || size.height != last_size.height) {
      last_size = size;
      dirty = true;
    }
    if (dirty) {
      const std::optional<NodeDetail>& detail = navigator.detail();
      const size_t detail_rows =
          detail_panel_rows(size, detail.has_value(), detail ? detail->attributes.size() : 0);
      const size_t body_rows = list_body_rows(size, detail_rows);
      // A page is one screenful of rows; the configured size applies when rows are unknown.
      navigator.set_page_size(height_known ? body_rows
                                           : static_cast<size_t>(settings.page_size));
      scroll_top = scroll_for_selection(scroll_top, navigator.selected(), body_rows,
                                        navigator.current_level().children.size());
      ViewModel view = navigator.view(scroll_top, body_rows);
      draw_frame(render_frame_lines(view, size, settings.color));
      dirty = false;
    }

    // Poll so terminal resizes are picked up without a keypress.
    if (!wait_input_ready(settings.poll_timeout_ms)) continue;
    KeyInput key = read_key_event();
    if (key.event == KeyEvent::None) continue;
    const size_t depth_before = navigator.depth();
    std::optional<NavCommand> command = command_for_key(key);
    if (!command.has_value()) continue;
    running = navigator.apply(*command);
    if (navigator.depth() != depth_before) scroll_top = 0;
    dirty = true;
  }
  return 0;
}

}  // namespace xmlnav::cli
