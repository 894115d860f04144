#pragma once

#include <termios.h>

namespace xmlnav::cli {

/// Switches stdin to raw mode for the guard's lifetime and restores it on destruction.
class TermiosGuard {
 public:
  TermiosGuard();
  ~TermiosGuard();
  TermiosGuard(const TermiosGuard&) = delete;
  TermiosGuard& operator=(const TermiosGuard&) = delete;

  bool ok() const { return ok_; }

 private:
  termios original_{};
  bool ok_ = false;
};

/// Enters the alternate screen with a hidden cursor; leaves and restores on destruction.
struct AlternateScreenGuard {
  AlternateScreenGuard();
  ~AlternateScreenGuard();
};

/// Returns the terminal width in columns, or 80 when unknown.
int terminal_width();
/// Returns the terminal height in rows, or 0 when unknown.
int terminal_height();

/// Waits up to `timeout_ms` for stdin to become readable.
bool wait_input_ready(int timeout_ms);
/// Reads one byte if it arrives within `timeout_ms`.
bool read_byte_with_timeout(char* out, int timeout_ms);

}  // namespace xmlnav::cli
