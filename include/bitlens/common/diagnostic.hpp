#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bitlens {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kInvalidLiteral,    // Text matches no literal grammar
  kInvalidFieldMap,   // Malformed or duplicate field definitions
  kFieldNotFound,     // Unknown field name against the active map
  kRangeOutOfBounds,  // Bit range exceeds the value width, or low > high
  kHostError,         // I/O, malformed external input, bad configuration
  kWarning,           // Non-fatal
  kNote,              // Auxiliary message
};

// Half-open byte offsets into the text a diagnostic refers to.
struct TextSpan {
  uint32_t begin = 0;
  uint32_t end = 0;

  auto operator==(const TextSpan&) const -> bool = default;
};

struct Diagnostic {
  DiagKind kind = DiagKind::kHostError;
  std::string message;
  // The offending piece of input: bad substring, duplicate name, etc.
  std::string subject;
  // Full input the span points into (literal errors only).
  std::string input;
  std::optional<TextSpan> span;
  std::vector<std::string> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: literal text rejected by the parser. `span` locates `subject`
  // inside `input`.
  static auto InvalidLiteral(
      std::string input, TextSpan span, std::string msg) -> Diagnostic {
    std::string subject = input.substr(span.begin, span.end - span.begin);
    return Diagnostic{
        .kind = DiagKind::kInvalidLiteral,
        .message = std::move(msg),
        .subject = std::move(subject),
        .input = std::move(input),
        .span = span,
        .notes = {},
    };
  }

  static auto InvalidFieldMap(std::string subject, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kInvalidFieldMap,
        .message = std::move(msg),
        .subject = std::move(subject),
        .input = {},
        .span = std::nullopt,
        .notes = {},
    };
  }

  static auto FieldNotFound(std::string name) -> Diagnostic {
    std::string msg = "unknown field '" + name + "'";
    return Diagnostic{
        .kind = DiagKind::kFieldNotFound,
        .message = std::move(msg),
        .subject = std::move(name),
        .input = {},
        .span = std::nullopt,
        .notes = {},
    };
  }

  static auto RangeOutOfBounds(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kRangeOutOfBounds,
        .message = std::move(msg),
        .subject = {},
        .input = {},
        .span = std::nullopt,
        .notes = {},
    };
  }

  // Factory: host error without a subject (I/O, config, decoding)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = DiagKind::kHostError,
        .message = std::move(msg),
        .subject = {},
        .input = {},
        .span = std::nullopt,
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace bitlens
