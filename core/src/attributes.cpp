#include "xmlnav/attributes.h"

#include "xmlnav/tokenizer.h"

namespace xmlnav {

namespace {

bool is_key_end(char c) {
  return c == '=' || c == '>' || c == '/' || is_xml_space(c);
}

void skip_ws(std::string_view s, size_t& i) {
  while (i < s.size() && is_xml_space(s[i])) ++i;
}

}  // namespace

std::vector<Attribute> attributes_at(std::string_view xml, size_t tag_start_offset) {
  std::vector<Attribute> out;
  if (tag_start_offset >= xml.size() || xml[tag_start_offset] != '<') return out;
  size_t i = tag_start_offset + 1;
  if (i < xml.size() && (xml[i] == '/' || xml[i] == '!' || xml[i] == '?')) return out;

  while (i < xml.size() && !is_xml_space(xml[i]) && xml[i] != '/' && xml[i] != '>') ++i;

  while (i < xml.size()) {
    skip_ws(xml, i);
    if (i >= xml.size() || xml[i] == '>' || xml[i] == '/') break;

    const size_t key_start = i;
    while (i < xml.size() && !is_key_end(xml[i])) ++i;
    std::string_view key = xml.substr(key_start, i - key_start);
    skip_ws(xml, i);
    if (i >= xml.size()) break;
    if (xml[i] != '=') {
      // Bare token: drop it and resume at whatever follows.
      continue;
    }
    ++i;
    skip_ws(xml, i);
    if (i >= xml.size()) break;

    std::string_view value;
    const char quote = xml[i];
    if (quote == '"' || quote == '\'') {
      const size_t value_start = i + 1;
      const size_t value_end = xml.find(quote, value_start);
      if (value_end == std::string_view::npos) break;
      value = xml.substr(value_start, value_end - value_start);
      i = value_end + 1;
    } else {
      const size_t value_start = i;
      while (i < xml.size() && !is_xml_space(xml[i]) && xml[i] != '>' && xml[i] != '/') ++i;
      value = xml.substr(value_start, i - value_start);
    }
    if (!key.empty()) out.push_back({key, value});
  }
  return out;
}

}  // namespace xmlnav
