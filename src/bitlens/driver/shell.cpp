#include "shell.hpp"

#include <cctype>
#include <cstdint>
#include <format>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bitlens/analysis/comparator.hpp"
#include "bitlens/analysis/extractor.hpp"
#include "bitlens/common/bit_range.hpp"
#include "bitlens/common/diagnostic.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/render/renderer.hpp"
#include "bitlens/value/literal_parser.hpp"
#include "print.hpp"
#include "report.hpp"

namespace bitlens::driver {

namespace {

auto Trim(std::string_view text) -> std::string_view {
  auto start = text.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

auto SplitWords(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> words;
  size_t pos = 0;
  while (pos < text.size()) {
    auto start = text.find_first_not_of(" \t", pos);
    if (start == std::string_view::npos) {
      break;
    }
    auto end = text.find_first_of(" \t", start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    words.push_back(text.substr(start, end - start));
    pos = end;
  }
  return words;
}

// Command words match in any case; field names do not.
auto ToLower(std::string_view text) -> std::string {
  std::string lowered(text);
  for (char& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lowered;
}

// Looks like an attempt at a command or field name rather than a number.
auto IsWordLike(std::string_view text) -> bool {
  if (text.empty() ||
      std::isalpha(static_cast<unsigned char>(text.front())) == 0) {
    return false;
  }
  for (char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
      return false;
    }
  }
  return true;
}

auto ParseOutputCommand(std::string_view word)
    -> std::optional<render::OutputFormat> {
  if (!word.starts_with("to_")) {
    return std::nullopt;
  }
  auto name = word.substr(3);
  if (name != "hex" && name != "dec" && name != "bin") {
    return std::nullopt;
  }
  return render::ParseOutputFormat(name);
}

}  // namespace

auto Shell::Execute(std::string_view line) -> ShellAction {
  std::string_view input = Trim(line);
  if (input.empty()) {
    return ShellAction::kContinue;
  }
  const std::string word = ToLower(input);

  if (word == "q" || word == "quit" || word == "exit") {
    out_ << "Exiting.\n";
    return ShellAction::kQuit;
  }
  if (word == "help") {
    PrintHelp();
    PrintStatus();
    return ShellAction::kContinue;
  }
  if (word == "hex" || word == "dec" || word == "bin") {
    session_.parse.bare_radix = *value::ParseRadixName(word);
    out_ << std::format(
        "Input radix changed to: {}\n",
        value::RadixName(session_.parse.bare_radix));
    PrintStatus();
    return ShellAction::kContinue;
  }
  if (auto format = ParseOutputCommand(word)) {
    session_.display.output_format = *format;
    out_ << std::format(
        "Output format changed to: {}\n", render::OutputFormatName(*format));
    PrintStatus();
    return ShellAction::kContinue;
  }
  if (word == "byte_align" || word == "dw_align") {
    session_.display.alignment = *render::ParseAlignment(word);
    out_ << std::format(
        "Alignment changed to: {}\n",
        render::AlignmentName(session_.display.alignment));
    PrintStatus();
    return ShellAction::kContinue;
  }
  if (word == "list") {
    out_ << FormatFieldListing(
                session_.fields.Current(),
                last_value_ ? &*last_value_ : nullptr, session_.display)
         << "\n";
    return ShellAction::kContinue;
  }
  if (word == "cmp" || word.starts_with("cmp ") ||
      word.starts_with("cmp\t")) {
    CompareLiterals(input.substr(3));
    return ShellAction::kContinue;
  }

  if (input.size() > 1 && word.front() == 'r' &&
      input.find('-') != std::string_view::npos) {
    if (auto range = ParseBitSelector(input.substr(1))) {
      ExtractBits(range->low, range->high, "");
      return ShellAction::kContinue;
    }
  }
  if (const auto* spec = session_.fields.Current().Find(input)) {
    ExtractBits(spec->range.low, spec->range.high, spec->name);
    return ShellAction::kContinue;
  }

  ShowLiteral(input);
  return ShellAction::kContinue;
}

void Shell::Run(std::istream& in, bool interactive) {
  if (interactive) {
    out_ << "bitlens interactive shell\n";
    PrintHelp();
    PrintStatus();
  }

  std::string line;
  while (true) {
    if (interactive) {
      out_ << "> " << std::flush;
    }
    if (!std::getline(in, line)) {
      break;
    }
    if (Execute(line) == ShellAction::kQuit) {
      break;
    }
  }
}

void Shell::PrintHelp() {
  out_ << "Commands:\n"
          "  hex / dec / bin           radix of bare digits\n"
          "  to_hex / to_dec / to_bin  output format\n"
          "  byte_align / dw_align     alignment unit\n"
          "  r<low>-<high>             extract a bit range of the last value\n"
          "  <field>                   extract a field of the last value\n"
          "  list                      show fields (values once parsed)\n"
          "  cmp <lit> [<lit>]         compare two values, or the last value "
          "with one\n"
          "  help                      show this text\n"
          "  q                         quit\n"
          "Anything else is parsed as a literal.\n";
}

void Shell::PrintStatus() {
  out_ << std::format(
      "Current settings: input = {}, output = {}, align = {}\n",
      value::RadixName(session_.parse.bare_radix),
      render::OutputFormatName(session_.display.output_format),
      render::AlignmentName(session_.display.alignment));
}

void Shell::Report(const Diagnostic& diag) {
  ++error_count_;
  err_ << FormatDiagnostic(diag, colors_) << "\n";
}

void Shell::ShowLiteral(std::string_view text) {
  auto parsed = value::Parse(text, session_.parse);
  if (!parsed) {
    if (IsWordLike(text)) {
      Report(
          std::move(parsed.error())
              .WithNote(
                  std::format(
                      "'{}' is not a command or a field of the active map; "
                      "type 'help' for commands",
                      text)));
      return;
    }
    Report(parsed.error());
    return;
  }

  last_value_ = std::move(*parsed);
  const auto& display = session_.display;
  out_ << std::format(
      "[Result] input = {}, output = {}, align = {}\n",
      value::RadixName(session_.parse.bare_radix),
      render::OutputFormatName(display.output_format),
      render::AlignmentName(display.alignment));
  out_ << "value: " << render::Render(*last_value_, display) << "\n";
  out_ << render::RenderBreakdown(*last_value_, display) << "\n";
}

void Shell::ExtractBits(
    uint32_t low, uint32_t high, std::string_view field_name) {
  if (!last_value_) {
    Report(
        Diagnostic::HostError("no parsed value yet")
            .WithNote("enter a literal first"));
    return;
  }
  auto extracted = analysis::ExtractRange(*last_value_, low, high);
  if (!extracted) {
    Report(extracted.error());
    return;
  }
  out_ << FormatExtraction(
              BitRange{.low = low, .high = high}, field_name, *extracted,
              session_.display)
       << "\n";
}

void Shell::CompareLiterals(std::string_view args) {
  auto words = SplitWords(args);
  if (words.empty() || words.size() > 2) {
    Report(Diagnostic::HostError("usage: cmp <literal> [<literal>]"));
    return;
  }

  std::vector<value::ParsedValue> values;
  if (words.size() == 1) {
    if (!last_value_) {
      Report(
          Diagnostic::HostError("no parsed value yet")
              .WithNote("use 'cmp <literal> <literal>' or enter a literal"));
      return;
    }
    values.push_back(*last_value_);
  }
  for (auto word : words) {
    auto parsed = value::Parse(word, session_.parse);
    if (!parsed) {
      Report(parsed.error());
      return;
    }
    values.push_back(std::move(*parsed));
  }

  auto diff =
      analysis::Compare(values[0], values[1], session_.fields.Current());
  out_ << analysis::FormatDiff(diff, session_.display) << "\n";
}

}  // namespace bitlens::driver
