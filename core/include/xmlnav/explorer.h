#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "xmlnav/attributes.h"

namespace xmlnav {

/// A resolved element occurrence borrowed from the source buffer.
/// `offset` is the byte position of the element's `<` and is its only stable identity;
/// tag names are not unique.
struct Node {
  std::string_view tag;
  /// First direct text run of the element, when it has one at depth 1.
  std::optional<std::string_view> text;
  size_t offset = 0;
  std::string_view raw_attributes;
};

/// Resolves roots, children and attributes lazily over an immutable buffer.
/// Children lists are memoized by parent offset and never invalidated.
/// MUST NOT outlive the buffer it was constructed over; not thread-safe.
class Explorer {
 public:
  /// Constructs an explorer over a borrowed buffer.
  /// MUST NOT outlive the referenced buffer.
  explicit Explorer(std::string_view xml);

  /// Returns the first element of the document, or nullopt when there is none.
  /// Stops scanning at the first start tag.
  std::optional<Node> root() const;

  /// Returns the direct child elements of `node` in document order.
  /// MUST scan at most once per distinct offset; later calls return the cached list.
  /// Offsets beyond the buffer yield an empty list. The returned reference stays valid
  /// for the lifetime of the explorer.
  const std::vector<Node>& children(const Node& node);

  /// Returns the attributes of `node` in document order.
  std::vector<Attribute> attributes(const Node& node) const;

  /// Number of child-resolution scans performed so far (cache misses).
  size_t scan_count() const { return scan_count_; }
  /// Number of parents whose children are cached.
  size_t cached_parent_count() const { return cache_.size(); }

  std::string_view source() const { return xml_; }

 private:
  std::vector<Node> resolve_children(const Node& node) const;

  std::string_view xml_;
  std::unordered_map<size_t, std::vector<Node>> cache_;
  size_t scan_count_ = 0;
};

}  // namespace xmlnav
