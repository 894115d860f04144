#include "input/terminal.h"

#include <iostream>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <unistd.h>

namespace xmlnav::cli {

TermiosGuard::TermiosGuard() {
  if (tcgetattr(STDIN_FILENO, &original_) != 0) return;
  termios raw = original_;
  raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG | IEXTEN));
  raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  ok_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0;
}

TermiosGuard::~TermiosGuard() {
  if (ok_) tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
}

AlternateScreenGuard::AlternateScreenGuard() {
  std::cout << "\033[?1049h\033[?25l" << std::flush;
}

AlternateScreenGuard::~AlternateScreenGuard() {
  std::cout << "\033[?25h\033[?1049l" << std::flush;
}

int terminal_width() {
  winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
    return ws.ws_col;
  }
  return 80;
}

int terminal_height() {
  winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) {
    return ws.ws_row;
  }
  return 0;
}

bool wait_input_ready(int timeout_ms) {
  if (timeout_ms < 0) timeout_ms = 0;
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(STDIN_FILENO, &readfds);
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  int ready = select(STDIN_FILENO + 1, &readfds, nullptr, nullptr, &tv);
  return ready > 0;
}

bool read_byte_with_timeout(char* out, int timeout_ms) {
  if (!out) return false;
  if (!wait_input_ready(timeout_ms)) return false;
  return ::read(STDIN_FILENO, out, 1) > 0;
}

}  // namespace xmlnav::cli
