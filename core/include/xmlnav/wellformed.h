#pragma once

#include <string>
#include <string_view>

namespace xmlnav {

/// Outcome of a strict well-formedness pass.
struct WellFormedReport {
  bool ok = true;
  /// First fatal parser message, without trailing newline. Empty when ok.
  std::string message;
  int line = 0;
  int column = 0;
};

/// Parses `xml` with libxml2 in chunks without building a tree.
/// MUST NOT access the network, load external entities, or print to stderr.
/// Inputs are a borrowed buffer; outputs are the report only.
WellFormedReport check_well_formed(std::string_view xml);

/// Formats a report as "well-formed" or "line L, column C: message".
std::string format_well_formed_report(const WellFormedReport& report);

}  // namespace xmlnav
