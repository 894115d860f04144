#include "xmlnav/navigator.h"

#include <algorithm>

#include "util/string_util.h"

namespace xmlnav {

Navigator::Navigator(Explorer& explorer, size_t page_size)
    : explorer_(explorer), page_size_(std::max<size_t>(page_size, 1)) {
  Level root_level;
  std::optional<Node> root = explorer_.root();
  if (root.has_value()) {
    root_level.children.push_back(*root);
  }
  stack_.push_back(std::move(root_level));
}

const Node* Navigator::selected_node() const {
  const Level& level = stack_.back();
  if (selected_ >= level.children.size()) return nullptr;
  return &level.children[selected_];
}

void Navigator::select(size_t index) {
  const size_t count = stack_.back().children.size();
  if (count == 0) {
    selected_ = 0;
  } else {
    selected_ = std::min(index, count - 1);
  }
  if (!detail_.has_value()) return;
  const Node* node = selected_node();
  if (node == nullptr) {
    detail_.reset();
  } else if (node->offset != detail_->node_offset) {
    detail_ = fetch_detail(*node);
  }
}

void Navigator::move_down() {
  select(selected_ + 1);
}

void Navigator::move_up() {
  if (selected_ == 0) return;
  select(selected_ - 1);
}

void Navigator::page_down() {
  select(selected_ + page_size_);
}

void Navigator::page_up() {
  select(selected_ > page_size_ ? selected_ - page_size_ : 0);
}

void Navigator::jump_first() {
  select(0);
}

void Navigator::jump_last() {
  const size_t count = stack_.back().children.size();
  select(count == 0 ? 0 : count - 1);
}

void Navigator::descend() {
  const Node* node = selected_node();
  if (node == nullptr) return;
  // Copy before push_back: the pointer refers into the stack being grown.
  const Node target = *node;
  Level next;
  next.tag = target.tag;
  next.children = explorer_.children(target);
  stack_.back().last_selected = selected_;
  stack_.push_back(std::move(next));
  select(0);
}

void Navigator::ascend() {
  if (stack_.size() <= 1) return;
  stack_.pop_back();
  select(stack_.back().last_selected);
}

void Navigator::toggle_detail() {
  if (detail_.has_value()) {
    detail_.reset();
    return;
  }
  const Node* node = selected_node();
  if (node == nullptr) return;
  detail_ = fetch_detail(*node);
}

NodeDetail Navigator::fetch_detail(const Node& node) {
  NodeDetail detail;
  detail.node_offset = node.offset;
  detail.attributes = explorer_.attributes(node);
  detail.child_count = explorer_.children(node).size();
  return detail;
}

bool Navigator::apply(NavCommand command) {
  switch (command) {
    case NavCommand::MoveDown:
      move_down();
      break;
    case NavCommand::MoveUp:
      move_up();
      break;
    case NavCommand::PageDown:
      page_down();
      break;
    case NavCommand::PageUp:
      page_up();
      break;
    case NavCommand::JumpFirst:
      jump_first();
      break;
    case NavCommand::JumpLast:
      jump_last();
      break;
    case NavCommand::Descend:
      descend();
      break;
    case NavCommand::Ascend:
      ascend();
      break;
    case NavCommand::ToggleDetail:
      toggle_detail();
      break;
    case NavCommand::Quit:
      return false;
  }
  return true;
}

void Navigator::set_page_size(size_t page_size) {
  page_size_ = std::max<size_t>(page_size, 1);
}

ViewModel Navigator::view(size_t first_row, size_t max_rows) const {
  const Level& level = stack_.back();
  ViewModel model;
  model.level_tag = level.tag;
  model.selected = selected_;
  model.child_count = level.children.size();
  model.depth = depth();
  model.first_row = std::min(first_row, level.children.size());
  const size_t end = model.first_row + std::min(max_rows, level.children.size() - model.first_row);
  model.rows.reserve(end - model.first_row);
  for (size_t i = model.first_row; i < end; ++i) {
    const Node& child = level.children[i];
    ViewRow row;
    row.tag = child.tag;
    row.text = child.text;
    row.attribute_preview = make_attribute_preview(child.raw_attributes, preview_chars_);
    model.rows.push_back(std::move(row));
  }
  if (detail_.has_value()) {
    model.detail_visible = true;
    model.detail_attributes = detail_->attributes;
    model.detail_child_count = detail_->child_count;
  }
  return model;
}

std::optional<std::string> make_attribute_preview(std::string_view raw_attributes,
                                                  size_t max_chars) {
  std::string compact = util::compact_whitespace(raw_attributes);
  if (compact.empty() || max_chars == 0) return std::nullopt;
  return util::truncate_chars(compact, max_chars);
}

}  // namespace xmlnav
