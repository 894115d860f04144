#pragma once

#include <optional>
#include <string_view>

#include "xmlnav/navigator.h"

namespace xmlnav::cli {

enum class KeyEvent {
  None,
  Up,
  Down,
  Left,
  Right,
  PageUp,
  PageDown,
  Home,
  End,
  Enter,
  Backspace,
  Space,
  Character,
  Escape,
  Quit,
};

struct KeyInput {
  KeyEvent event = KeyEvent::None;
  char ch = 0;
};

/// Decodes one complete key sequence (a single byte or an escape sequence).
/// Unknown sequences decode to None; a lone ESC decodes to Escape.
KeyInput decode_key_sequence(std::string_view bytes);

/// Reads one key from stdin, collecting escape-sequence bytes with a short timeout.
/// MUST return Quit when stdin is closed.
KeyInput read_key_event();

/// Maps a key to its navigation command, or nullopt when the key is unbound.
std::optional<NavCommand> command_for_key(const KeyInput& key);

}  // namespace xmlnav::cli
