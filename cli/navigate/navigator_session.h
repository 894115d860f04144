#pragma once

#include <ostream>
#include <string>

#include "config.h"

namespace xmlnav::cli {

/// Runs the interactive navigator on `input` until the user quits.
/// MUST restore the terminal on every exit path. Returns 0 on a normal quit,
/// 1 when the terminal cannot be prepared, 2 for usage or input errors.
int run_navigator(const std::string& input, const NavigatorSettings& settings, std::ostream& err);

}  // namespace xmlnav::cli
