#pragma once

#include <string>

#include "bitlens/common/diagnostic.hpp"

namespace bitlens::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Print to stderr, colored when stderr is a terminal.
void PrintDiagnostic(const Diagnostic& diag);

// "bitlens: error: <message>", then the offending input with a caret marker
// under the bad substring when the diagnostic has a span, then notes.
// No trailing newline.
auto FormatDiagnostic(const Diagnostic& diag, bool colors = false)
    -> std::string;

}  // namespace bitlens::driver
