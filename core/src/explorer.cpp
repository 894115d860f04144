#include "xmlnav/explorer.h"

#include "xmlnav/tokenizer.h"

namespace xmlnav {

Explorer::Explorer(std::string_view xml) : xml_(xml) {}

std::optional<Node> Explorer::root() const {
  std::optional<Node> found;
  scan(xml_, [&](const Token& token) {
    if (token.kind != TokenKind::StartTag) return ScanControl::Continue;
    Node node;
    node.tag = token.name;
    node.offset = token.offset;
    node.raw_attributes = token.raw_attributes;
    found = node;
    return ScanControl::Stop;
  });
  return found;
}

const std::vector<Node>& Explorer::children(const Node& node) {
  auto it = cache_.find(node.offset);
  if (it != cache_.end()) return it->second;
  ++scan_count_;
  auto inserted = cache_.emplace(node.offset, resolve_children(node));
  return inserted.first->second;
}

std::vector<Attribute> Explorer::attributes(const Node& node) const {
  return attributes_at(xml_, node.offset);
}

std::vector<Node> Explorer::resolve_children(const Node& node) const {
  std::vector<Node> children;
  if (node.offset >= xml_.size()) return children;

  // Scan only from the parent's `<`; the stop at its closing tag bounds the cost
  // to the subtree.
  const std::string_view slice = xml_.substr(node.offset);
  size_t depth = 0;
  bool inside = false;
  bool collecting = false;
  Node pending;

  scan(slice, [&](const Token& token) {
    switch (token.kind) {
      case TokenKind::StartTag:
        if (!inside) {
          if (token.name == node.tag) inside = true;
          return ScanControl::Continue;
        }
        if (depth == 0) {
          pending = Node{};
          pending.tag = token.name;
          pending.offset = node.offset + token.offset;
          pending.raw_attributes = token.raw_attributes;
          collecting = true;
        }
        ++depth;
        return ScanControl::Continue;
      case TokenKind::EndTag:
        if (!inside) return ScanControl::Continue;
        if (depth == 0) {
          // A stray end tag at this level is ignored; only the parent's name closes it.
          return token.name == node.tag ? ScanControl::Stop : ScanControl::Continue;
        }
        --depth;
        if (depth == 0 && collecting) {
          children.push_back(pending);
          collecting = false;
        }
        return ScanControl::Continue;
      case TokenKind::Text:
        if (collecting && depth == 1 && !pending.text.has_value()) {
          pending.text = token.text;
        }
        return ScanControl::Continue;
    }
    return ScanControl::Continue;
  });
  return children;
}

}  // namespace xmlnav
