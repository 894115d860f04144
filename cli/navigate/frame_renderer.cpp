#include "navigate/frame_renderer.h"

#include <algorithm>
#include <string_view>

#include "ui/color.h"

namespace xmlnav::cli {

namespace {

constexpr size_t kHelpRows = 1;
constexpr size_t kBorderRows = 2;
constexpr const char* kHelpText =
    "↑/↓ move  PgUp/PgDn page  Home/End jump  Enter/→ in  Backspace/← up  Space details  q quit";

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

size_t code_point_width(std::string_view text) {
  size_t n = 0;
  for (char c : text) {
    if (!is_continuation(static_cast<unsigned char>(c))) ++n;
  }
  return n;
}

std::string repeat_utf8(std::string_view token, size_t count) {
  std::string out;
  out.reserve(token.size() * count);
  for (size_t i = 0; i < count; ++i) out.append(token.data(), token.size());
  return out;
}

/// Collapses whitespace and control bytes so borrowed text always fits on one row.
std::string single_line(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool in_space = false;
  for (char c : text) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F || c == ' ') {
      if (!in_space && !out.empty()) out.push_back(' ');
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(c);
  }
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

/// Accumulates styled segments up to a visible-width limit.
class StyledLine {
 public:
  StyledLine(size_t limit, bool color) : limit_(limit), color_(color) {}

  void append(std::string_view text, const std::string& style = std::string()) {
    if (width_ >= limit_ || text.empty()) return;
    size_t i = 0;
    size_t taken = 0;
    while (i < text.size() && width_ + taken < limit_) {
      ++i;
      while (i < text.size() && is_continuation(static_cast<unsigned char>(text[i]))) ++i;
      ++taken;
    }
    if (color_ && !style.empty()) out_ += style;
    out_.append(text.data(), i);
    if (color_ && !style.empty()) out_ += kColor.reset;
    width_ += taken;
  }

  void pad_to(size_t width, const std::string& style = std::string()) {
    if (width_ >= width) return;
    append(std::string(width - width_, ' '), style);
  }

  const std::string& str() const { return out_; }

 private:
  size_t limit_;
  bool color_;
  size_t width_ = 0;
  std::string out_;
};

std::string top_border(const std::string& label, size_t width, bool color) {
  const size_t middle = width - 2;
  StyledLine clipped(middle, false);
  clipped.append(label);
  const std::string text = clipped.str();
  const size_t label_w = code_point_width(text);
  const size_t left = (middle - label_w) / 2;
  const size_t right = middle - label_w - left;
  std::string out = "┌" + repeat_utf8("─", left);
  if (color) {
    out += std::string(kColor.bold) + kColor.cyan + text + kColor.reset;
  } else {
    out += text;
  }
  out += repeat_utf8("─", right) + "┐";
  return out;
}

std::string bottom_border(size_t width) {
  return "└" + repeat_utf8("─", width - 2) + "┘";
}

std::string boxed(const StyledLine& content) {
  return "│" + content.str() + "│";
}

std::string render_child_row(const ViewRow& row, bool selected, size_t inner, bool color) {
  const std::string base = selected ? std::string(kColor.reverse) : std::string();
  StyledLine line(inner, color);
  line.append(selected ? "→ " : "  ", base + (selected ? kColor.yellow : ""));
  line.append(single_line(row.tag), base + kColor.bold + kColor.magenta);
  if (row.attribute_preview.has_value()) {
    line.append(" " + *row.attribute_preview, base + (selected ? kColor.cyan : kColor.gray));
  }
  if (row.text.has_value()) {
    line.append("  ", base);
    line.append(single_line(*row.text), base + kColor.italic + kColor.green);
  }
  line.pad_to(inner, base);
  return boxed(line);
}

std::vector<std::string> render_detail_panel(const ViewModel& view,
                                             size_t rows,
                                             size_t width,
                                             bool color) {
  std::vector<std::string> out;
  if (rows < 2) return out;
  const size_t inner = width - 2;
  std::vector<StyledLine> body;

  StyledLine count_line(inner, color);
  count_line.append(" Children count: ", kColor.cyan);
  count_line.append(std::to_string(view.detail_child_count), std::string(kColor.bold) + kColor.yellow);
  body.push_back(count_line);

  StyledLine header(inner, color);
  header.append(" Attributes:", kColor.cyan);
  body.push_back(header);

  if (view.detail_attributes.empty()) {
    StyledLine none(inner, color);
    none.append("   (none)", kColor.gray);
    body.push_back(none);
  } else {
    for (const auto& attr : view.detail_attributes) {
      StyledLine line(inner, color);
      line.append("   ");
      line.append(single_line(attr.key), kColor.magenta);
      line.append(" = ");
      line.append(single_line(attr.value), kColor.green);
      body.push_back(line);
    }
  }

  out.push_back(top_border(" Element Details ", width, color));
  const size_t body_rows = rows - 2;
  for (size_t i = 0; i < body_rows; ++i) {
    if (i < body.size()) {
      StyledLine& line = body[i];
      if (i + 1 == body_rows && body.size() > body_rows) {
        StyledLine more(inner, color);
        more.append("   ...", kColor.gray);
        more.pad_to(inner);
        out.push_back(boxed(more));
        continue;
      }
      line.pad_to(inner);
      out.push_back(boxed(line));
    } else {
      StyledLine blank(inner, color);
      blank.pad_to(inner);
      out.push_back(boxed(blank));
    }
  }
  out.push_back(bottom_border(width));
  return out;
}

}  // namespace

size_t detail_panel_rows(const FrameSize& size, bool detail_visible, size_t attribute_count) {
  if (!detail_visible) return 0;
  // Borders, the child count line, the "Attributes:" header, then one row per attribute.
  const size_t wanted = kBorderRows + 2 + std::max<size_t>(attribute_count, 1);
  const size_t chrome = kBorderRows + kHelpRows;
  const size_t available = size.height > chrome ? size.height - chrome : 0;
  const size_t cap = available / 2;
  if (cap < kBorderRows + 1) return 0;
  return std::min(wanted, cap);
}

size_t list_body_rows(const FrameSize& size, size_t detail_rows) {
  const size_t chrome = kBorderRows + kHelpRows + detail_rows;
  if (size.height <= chrome) return 1;
  return size.height - chrome;
}

size_t scroll_for_selection(size_t scroll_top, size_t selected, size_t body_rows, size_t count) {
  if (count == 0 || body_rows == 0) return 0;
  if (selected < scroll_top) return selected;
  if (selected >= scroll_top + body_rows) return selected - body_rows + 1;
  // Pull back when the level shrank below the current window.
  if (scroll_top + body_rows > count && count >= body_rows) return count - body_rows;
  return scroll_top;
}

std::string level_title(const ViewModel& view) {
  const size_t position = view.child_count > 0 ? view.selected + 1 : 0;
  std::string counter = "[" + std::to_string(position) + "/" + std::to_string(view.child_count) + "]";
  if (view.level_tag.has_value()) {
    return "<" + single_line(*view.level_tag) + ">  " + counter;
  }
  return "Root element  " + counter;
}

std::vector<std::string> render_frame_lines(const ViewModel& view, const FrameSize& size, bool color) {
  FrameSize frame = size;
  frame.width = std::max<size_t>(frame.width, 8);
  const size_t inner = frame.width - 2;
  const size_t detail_rows =
      detail_panel_rows(frame, view.detail_visible, view.detail_attributes.size());
  const size_t body_rows = list_body_rows(frame, detail_rows);

  std::vector<std::string> lines;
  lines.reserve(frame.height);
  lines.push_back(top_border(" XML Tree Navigator  " + level_title(view) + " ", frame.width, color));

  for (size_t i = 0; i < body_rows; ++i) {
    if (i < view.rows.size()) {
      const bool selected = view.first_row + i == view.selected;
      lines.push_back(render_child_row(view.rows[i], selected, inner, color));
      continue;
    }
    StyledLine blank(inner, color);
    if (i == 0 && view.child_count == 0) blank.append("  (no children)", kColor.gray);
    blank.pad_to(inner);
    lines.push_back(boxed(blank));
  }
  lines.push_back(bottom_border(frame.width));

  if (detail_rows > 0) {
    auto panel = render_detail_panel(view, detail_rows, frame.width, color);
    lines.insert(lines.end(), panel.begin(), panel.end());
  }

  StyledLine help(frame.width, color);
  help.append(kHelpText, std::string(kColor.gray) + kColor.italic);
  lines.push_back(help.str());
  return lines;
}

}  // namespace xmlnav::cli
