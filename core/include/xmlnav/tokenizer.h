#pragma once

#include <cstddef>
#include <string_view>

namespace xmlnav {

/// Enumerates the structural events produced by the tokenizer.
/// Comments, processing instructions and declarations never produce a token.
enum class TokenKind {
  StartTag,
  EndTag,
  Text,
};

/// One lexical event borrowed from the scanned buffer.
/// MUST NOT be stored beyond the callback invocation that received it unless the
/// caller also guarantees the buffer outlives the copy.
struct Token {
  TokenKind kind = TokenKind::Text;
  /// Tag name for StartTag/EndTag, empty for Text.
  std::string_view name;
  /// Unparsed text between the tag name and `>` (or a trailing `/`). StartTag only.
  std::string_view raw_attributes;
  /// Trimmed text run, never empty. Text only.
  std::string_view text;
  /// Byte position of the construct in the scanned buffer (`<` for tags).
  size_t offset = 0;
};

/// Returned by the consumer after each token to continue or abort the scan.
enum class ScanControl {
  Continue,
  Stop,
};

/// Tests for the ASCII whitespace set used by the tokenizer.
inline bool is_xml_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

namespace detail {

inline size_t find_byte(std::string_view s, char c, size_t from) {
  size_t pos = s.find(c, from);
  return pos == std::string_view::npos ? s.size() : pos;
}

inline size_t find_seq(std::string_view s, std::string_view seq, size_t from) {
  size_t pos = s.find(seq, from);
  return pos == std::string_view::npos ? s.size() : pos;
}

}  // namespace detail

/// Scans `xml` left to right and invokes `on_token` once per token in document order.
/// MUST stop silently at the first construct that cannot be fully delimited and
/// MUST never read outside `xml`. Returns true when the consumer requested a stop.
/// Inputs are a borrowed buffer and a callable `ScanControl(const Token&)`;
/// side effects are the callback invocations only (no allocation).
template <typename Callback>
bool scan(std::string_view xml, Callback&& on_token) {
  const size_t len = xml.size();
  size_t pos = 0;
  while (pos < len) {
    while (pos < len && is_xml_space(xml[pos])) ++pos;
    if (pos >= len) break;

    if (xml[pos] != '<') {
      const size_t start = pos;
      const size_t end = detail::find_byte(xml, '<', pos);
      size_t t_start = start;
      size_t t_end = end;
      while (t_start < t_end && is_xml_space(xml[t_start])) ++t_start;
      while (t_end > t_start && is_xml_space(xml[t_end - 1])) --t_end;
      if (t_end > t_start) {
        Token token;
        token.kind = TokenKind::Text;
        token.text = xml.substr(t_start, t_end - t_start);
        token.offset = t_start;
        if (on_token(static_cast<const Token&>(token)) == ScanControl::Stop) return true;
      }
      pos = end;
      continue;
    }

    const char next = pos + 1 < len ? xml[pos + 1] : '\0';
    if (next == '/') {
      const size_t start = pos + 2;
      const size_t end = detail::find_byte(xml, '>', start);
      if (end >= len) break;
      size_t name_end = end;
      while (name_end > start && is_xml_space(xml[name_end - 1])) --name_end;
      Token token;
      token.kind = TokenKind::EndTag;
      token.name = xml.substr(start, name_end - start);
      token.offset = pos;
      if (on_token(static_cast<const Token&>(token)) == ScanControl::Stop) return true;
      pos = end + 1;
      continue;
    }

    if (next == '!') {
      size_t end = 0;
      if (xml.compare(pos, 4, "<!--") == 0) {
        end = detail::find_seq(xml, "-->", pos + 4);
        if (end >= len) break;
        pos = end + 3;
      } else if (xml.compare(pos, 9, "<![CDATA[") == 0) {
        end = detail::find_seq(xml, "]]>", pos + 9);
        if (end >= len) break;
        pos = end + 3;
      } else {
        end = detail::find_byte(xml, '>', pos + 2);
        if (end >= len) break;
        pos = end + 1;
      }
      continue;
    }

    if (next == '?') {
      const size_t end = detail::find_seq(xml, "?>", pos + 2);
      if (end >= len) break;
      pos = end + 2;
      continue;
    }

    const size_t start = pos + 1;
    const size_t end = detail::find_byte(xml, '>', start);
    if (end >= len) break;
    const bool self_closing = end > start && xml[end - 1] == '/';
    size_t name_end = start;
    while (name_end < end && !is_xml_space(xml[name_end]) && xml[name_end] != '/') {
      ++name_end;
    }
    const size_t attrs_end = self_closing ? end - 1 : end;
    Token token;
    token.kind = TokenKind::StartTag;
    token.name = xml.substr(start, name_end - start);
    token.raw_attributes =
        attrs_end > name_end ? xml.substr(name_end, attrs_end - name_end) : std::string_view();
    token.offset = pos;
    if (on_token(static_cast<const Token&>(token)) == ScanControl::Stop) return true;
    if (self_closing) {
      Token closing;
      closing.kind = TokenKind::EndTag;
      closing.name = token.name;
      closing.offset = pos;
      if (on_token(static_cast<const Token&>(closing)) == ScanControl::Stop) return true;
    }
    pos = end + 1;
  }
  return false;
}

}  // namespace xmlnav
