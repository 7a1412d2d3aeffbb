#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/value/parsed_value.hpp"
#include "session.hpp"

namespace bitlens::driver {

enum class ShellAction : uint8_t { kContinue, kQuit };

// Line-oriented command loop. Owns the last successfully parsed value; the
// display state and field map live in the borrowed Session so a command can
// change them for the rest of the run.
//
// A line is, in order of precedence: a reserved command word, "cmp ...",
// "r<a>-<b>", a field name of the active map, or else a literal.
class Shell {
 public:
  Shell(
      Session& session, std::ostream& out, std::ostream& err,
      bool colors = false)
      : session_(session), out_(out), err_(err), colors_(colors) {
  }

  // Handle one line. Results go to `out`, diagnostics to `err`.
  auto Execute(std::string_view line) -> ShellAction;

  // Read lines until EOF or "q". With `interactive`, prints a banner and a
  // prompt before each line.
  void Run(std::istream& in, bool interactive);

  [[nodiscard]] auto LastValue() const
      -> const std::optional<value::ParsedValue>& {
    return last_value_;
  }

  // Lines that produced a diagnostic so far.
  [[nodiscard]] auto ErrorCount() const -> uint32_t {
    return error_count_;
  }

 private:
  void PrintHelp();
  void PrintStatus();
  void Report(const Diagnostic& diag);

  void ShowLiteral(std::string_view text);
  void ExtractBits(uint32_t low, uint32_t high, std::string_view field_name);
  void CompareLiterals(std::string_view args);

  Session& session_;
  std::ostream& out_;
  std::ostream& err_;
  bool colors_;
  std::optional<value::ParsedValue> last_value_;
  uint32_t error_count_ = 0;
};

}  // namespace bitlens::driver
