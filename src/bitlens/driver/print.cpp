#include "print.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>
#include <unistd.h>

#include "bitlens/common/diagnostic.hpp"

namespace bitlens::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kInvalidLiteral:
    case DiagKind::kInvalidFieldMap:
    case DiagKind::kFieldNotFound:
    case DiagKind::kRangeOutOfBounds:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kInvalidLiteral:
    case DiagKind::kInvalidFieldMap:
    case DiagKind::kFieldNotFound:
    case DiagKind::kRangeOutOfBounds:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Apply `style` only when colors are requested.
auto Styled(const std::string& text, fmt::text_style style, bool colors)
    -> std::string {
  if (!colors) {
    return text;
  }
  return fmt::format("{}", fmt::styled(text, style));
}

auto FormatLine(
    const char* kind_str, fmt::text_style kind_style, const std::string& message,
    bool bold_message, bool colors) -> std::string {
  return fmt::format(
      "{}: {} {}", Styled("bitlens", kToolStyle, colors),
      Styled(kind_str, kind_style, colors),
      Styled(
          message, bold_message ? fmt::emphasis::bold : fmt::text_style{},
          colors));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}\n",
      FormatLine(
          "error:", DiagKindToStyle(DiagKind::kHostError), message, true,
          isatty(STDERR_FILENO) != 0));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}\n",
      FormatLine(
          "warning:", DiagKindToStyle(DiagKind::kWarning), message, true,
          isatty(STDERR_FILENO) != 0));
}

void PrintDiagnostic(const Diagnostic& diag) {
  fmt::print(
      stderr, "{}\n", FormatDiagnostic(diag, isatty(STDERR_FILENO) != 0));
}

auto FormatDiagnostic(const Diagnostic& diag, bool colors) -> std::string {
  std::string out = FormatLine(
      DiagKindToString(diag.kind), DiagKindToStyle(diag.kind), diag.message,
      true, colors);

  // Echo the input and mark the offending substring
  if (diag.span && !diag.input.empty()) {
    const TextSpan& span = *diag.span;
    uint32_t width = span.end > span.begin ? span.end - span.begin : 1;
    std::string marker = "^" + std::string(width - 1, '~');
    constexpr auto kGutterStyle = fmt::fg(fmt::terminal_color::white);
    constexpr auto kMarkerStyle = fmt::fg(fmt::terminal_color::green);

    out += fmt::format(
        "\n {} {}", Styled("|", kGutterStyle, colors), diag.input);
    out += fmt::format(
        "\n {} {}{}", Styled("|", kGutterStyle, colors),
        std::string(span.begin, ' '), Styled(marker, kMarkerStyle, colors));
  }

  for (const auto& note : diag.notes) {
    out += "\n";
    out += FormatLine(
        DiagKindToString(DiagKind::kNote), DiagKindToStyle(DiagKind::kNote),
        note, false, colors);
  }
  return out;
}

}  // namespace bitlens::driver
