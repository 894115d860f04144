#include "navigate/key_bindings.h"

#include <string>
#include <unistd.h>

#include "input/terminal.h"

namespace xmlnav::cli {

namespace {

constexpr int kEscapeSequenceTimeoutMs = 25;

KeyInput decode_escape(std::string_view seq) {
  // seq excludes the leading ESC.
  if (seq.empty()) return {KeyEvent::Escape, 0};
  if (seq.size() >= 2 && (seq[0] == '[' || seq[0] == 'O')) {
    switch (seq[1]) {
      case 'A':
        return {KeyEvent::Up, 0};
      case 'B':
        return {KeyEvent::Down, 0};
      case 'C':
        return {KeyEvent::Right, 0};
      case 'D':
        return {KeyEvent::Left, 0};
      case 'H':
        return {KeyEvent::Home, 0};
      case 'F':
        return {KeyEvent::End, 0};
      default:
        break;
    }
  }
  if (seq.size() == 3 && seq[0] == '[' && seq[2] == '~') {
    switch (seq[1]) {
      case '1':
      case '7':
        return {KeyEvent::Home, 0};
      case '4':
      case '8':
        return {KeyEvent::End, 0};
      case '5':
        return {KeyEvent::PageUp, 0};
      case '6':
        return {KeyEvent::PageDown, 0};
      default:
        break;
    }
  }
  return {KeyEvent::None, 0};
}

}  // namespace

KeyInput decode_key_sequence(std::string_view bytes) {
  if (bytes.empty()) return {KeyEvent::None, 0};
  const char c = bytes[0];
  if (c == 27) return decode_escape(bytes.substr(1));
  if (bytes.size() > 1) return {KeyEvent::None, 0};
  if (c == 'q' || c == 'Q' || c == 3) return {KeyEvent::Quit, c};
  if (c == '\n' || c == '\r') return {KeyEvent::Enter, 0};
  if (c == 127 || c == 8) return {KeyEvent::Backspace, 0};
  if (c == ' ') return {KeyEvent::Space, c};
  unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= 0x20 && uc != 0x7F) return {KeyEvent::Character, c};
  return {KeyEvent::None, 0};
}

KeyInput read_key_event() {
  char c = 0;
  if (::read(STDIN_FILENO, &c, 1) <= 0) return {KeyEvent::Quit, 0};
  std::string seq(1, c);
  if (c != 27) return decode_key_sequence(seq);
  char next = 0;
  if (!read_byte_with_timeout(&next, kEscapeSequenceTimeoutMs)) return {KeyEvent::Escape, 0};
  seq.push_back(next);
  if (next != '[' && next != 'O') return {KeyEvent::None, 0};
  // CSI: parameter bytes until a final byte in '@'..'~'.
  while (seq.size() < 8) {
    if (!read_byte_with_timeout(&next, kEscapeSequenceTimeoutMs)) break;
    seq.push_back(next);
    if (next >= '@' && next <= '~') break;
  }
  return decode_key_sequence(seq);
}

std::optional<NavCommand> command_for_key(const KeyInput& key) {
  switch (key.event) {
    case KeyEvent::Up:
      return NavCommand::MoveUp;
    case KeyEvent::Down:
      return NavCommand::MoveDown;
    case KeyEvent::PageUp:
      return NavCommand::PageUp;
    case KeyEvent::PageDown:
      return NavCommand::PageDown;
    case KeyEvent::Home:
      return NavCommand::JumpFirst;
    case KeyEvent::End:
      return NavCommand::JumpLast;
    case KeyEvent::Enter:
    case KeyEvent::Right:
      return NavCommand::Descend;
    case KeyEvent::Backspace:
    case KeyEvent::Left:
      return NavCommand::Ascend;
    case KeyEvent::Space:
      return NavCommand::ToggleDetail;
    case KeyEvent::Quit:
      return NavCommand::Quit;
    case KeyEvent::Character:
      switch (key.ch) {
        case 'j':
          return NavCommand::MoveDown;
        case 'k':
          return NavCommand::MoveUp;
        case 'l':
          return NavCommand::Descend;
        case 'h':
          return NavCommand::Ascend;
        case 'g':
          return NavCommand::JumpFirst;
        case 'G':
          return NavCommand::JumpLast;
        default:
          return std::nullopt;
      }
    case KeyEvent::None:
    case KeyEvent::Escape:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace xmlnav::cli
