#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace xmlnav {

/// One raw key/value pair borrowed from the source buffer.
/// Values are never entity-decoded; quotes are stripped only.
struct Attribute {
  std::string_view key;
  std::string_view value;
};

/// Splits the attributes of the start tag whose `<` sits at `tag_start_offset`.
/// MUST return pairs in document order, MUST skip tokens without `=`, and MUST
/// return an empty list when the offset does not point at a start tag.
/// Inputs are a borrowed buffer and an offset; outputs borrow from the buffer.
std::vector<Attribute> attributes_at(std::string_view xml, size_t tag_start_offset);

}  // namespace xmlnav
