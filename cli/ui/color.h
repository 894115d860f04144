#pragma once

namespace xmlnav::cli {

/// ANSI escape codes shared by the error reporter, the stats report and the navigator.
struct ColorPalette {
  const char* red;
  const char* green;
  const char* yellow;
  const char* blue;
  const char* magenta;
  const char* cyan;
  const char* gray;
  const char* bold;
  const char* italic;
  const char* reverse;
  const char* reset;
};

inline constexpr ColorPalette kColor{
    "\033[31m", "\033[32m", "\033[33m", "\033[34m", "\033[35m", "\033[36m",
    "\033[90m", "\033[1m",  "\033[3m",  "\033[7m",  "\033[0m",
};

}  // namespace xmlnav::cli
