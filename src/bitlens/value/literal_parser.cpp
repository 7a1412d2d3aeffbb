#include "bitlens/value/literal_parser.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/common/wide_bit.hpp"
#include "bitlens/common/wide_bit_ops.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::value {

namespace {

auto IsSpace(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

auto IsDecimalDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

auto RadixBase(Radix radix) -> uint64_t {
  switch (radix) {
    case Radix::kHex:
      return 16;
    case Radix::kDecimal:
      return 10;
    case Radix::kBinary:
      return 2;
  }
  return 10;
}

// Upper bound on bits contributed per digit, used to size the accumulator.
auto BitsPerDigit(Radix radix) -> size_t {
  return radix == Radix::kBinary ? 1 : 4;
}

auto DigitValue(char c, Radix radix) -> std::optional<uint64_t> {
  uint64_t value = 0;
  if (c >= '0' && c <= '9') {
    value = static_cast<uint64_t>(c - '0');
  } else if (c >= 'a' && c <= 'f') {
    value = static_cast<uint64_t>(c - 'a' + 10);
  } else if (c >= 'A' && c <= 'F') {
    value = static_cast<uint64_t>(c - 'A' + 10);
  } else {
    return std::nullopt;
  }
  if (value >= RadixBase(radix)) {
    return std::nullopt;
  }
  return value;
}

auto RadixFromLetter(char c) -> std::optional<Radix> {
  switch (c) {
    case 'h':
    case 'H':
      return Radix::kHex;
    case 'd':
    case 'D':
      return Radix::kDecimal;
    case 'b':
    case 'B':
      return Radix::kBinary;
    default:
      return std::nullopt;
  }
}

class LiteralParser {
 public:
  LiteralParser(std::string_view input, const ParseOptions& options)
      : input_(input), options_(options) {
  }

  auto Run() -> Result<ParsedValue> {
    begin_ = 0;
    end_ = input_.size();
    while (begin_ < end_ && IsSpace(input_[begin_])) {
      ++begin_;
    }
    while (end_ > begin_ && IsSpace(input_[end_ - 1])) {
      --end_;
    }
    if (begin_ == end_) {
      return std::unexpected(Error(0, input_.size(), "empty literal"));
    }

    size_t tick = input_.find('\'', begin_);
    if (tick != std::string_view::npos && tick < end_) {
      return ParseVerilog(tick);
    }

    if (end_ - begin_ >= 2 && input_[begin_] == '0') {
      char prefix = input_[begin_ + 1];
      if (prefix == 'x' || prefix == 'X') {
        return ParsePrefixed(Radix::kHex, "hex");
      }
      if (prefix == 'b' || prefix == 'B') {
        return ParsePrefixed(Radix::kBinary, "binary");
      }
    }

    auto magnitude = ParseDigits(begin_, end_, options_.bare_radix, false);
    if (!magnitude) {
      return std::unexpected(std::move(magnitude.error()));
    }
    return Finish(std::move(*magnitude), std::nullopt, begin_, end_);
  }

 private:
  [[nodiscard]] auto Error(size_t begin, size_t end, std::string msg) const
      -> Diagnostic {
    return Diagnostic::InvalidLiteral(
        std::string(input_),
        TextSpan{
            .begin = static_cast<uint32_t>(begin),
            .end = static_cast<uint32_t>(end)},
        std::move(msg));
  }

  // <width>'<radix><digits> or '<radix><digits>
  auto ParseVerilog(size_t tick) -> Result<ParsedValue> {
    std::optional<uint32_t> width;
    if (tick > begin_) {
      auto parsed_width = ParseWidth(begin_, tick);
      if (!parsed_width) {
        return std::unexpected(std::move(parsed_width.error()));
      }
      width = *parsed_width;
    }

    size_t radix_pos = tick + 1;
    if (radix_pos >= end_) {
      return std::unexpected(
          Error(tick, end_, "expected radix 'h', 'b' or 'd' after '''"));
    }
    auto radix = RadixFromLetter(input_[radix_pos]);
    if (!radix) {
      return std::unexpected(Error(
          radix_pos, radix_pos + 1,
          std::format(
              "unknown radix '{}', expected 'h', 'b' or 'd'",
              input_[radix_pos])));
    }

    size_t digits_begin = radix_pos + 1;
    if (digits_begin >= end_) {
      return std::unexpected(
          Error(tick, end_, "missing digits after radix"));
    }
    auto magnitude = ParseDigits(digits_begin, end_, *radix, true);
    if (!magnitude) {
      return std::unexpected(std::move(magnitude.error()));
    }
    return Finish(std::move(*magnitude), width, digits_begin, end_);
  }

  // 0x<hex> / 0b<bin>
  auto ParsePrefixed(Radix radix, std::string_view radix_name)
      -> Result<ParsedValue> {
    size_t digits_begin = begin_ + 2;
    if (digits_begin >= end_) {
      return std::unexpected(Error(
          begin_, end_, std::format("missing {} digits after prefix",
                                    radix_name)));
    }
    auto magnitude = ParseDigits(digits_begin, end_, radix, false);
    if (!magnitude) {
      return std::unexpected(std::move(magnitude.error()));
    }
    return Finish(std::move(*magnitude), std::nullopt, digits_begin, end_);
  }

  auto ParseWidth(size_t begin, size_t end) -> Result<uint32_t> {
    uint64_t width = 0;
    for (size_t i = begin; i < end; ++i) {
      char c = input_[i];
      if (!IsDecimalDigit(c)) {
        return std::unexpected(Error(
            begin, end,
            std::format(
                "invalid width '{}', expected a decimal number",
                input_.substr(begin, end - begin))));
      }
      width = width * 10 + static_cast<uint64_t>(c - '0');
      if (width > options_.max_width) {
        return std::unexpected(Error(
            begin, end,
            std::format(
                "width {} exceeds the maximum of {} bits",
                input_.substr(begin, end - begin), options_.max_width)));
      }
    }
    if (width == 0) {
      return std::unexpected(
          Error(begin, end, "width must be at least 1 bit"));
    }
    return static_cast<uint32_t>(width);
  }

  auto ParseDigits(
      size_t begin, size_t end, Radix radix, bool allow_separators)
      -> Result<common::WideBit> {
    if (allow_separators) {
      if (input_[begin] == '_') {
        return std::unexpected(Error(
            begin, begin + 1, "digit separator '_' cannot start the digits"));
      }
      if (input_[end - 1] == '_') {
        return std::unexpected(Error(
            end - 1, end, "digit separator '_' cannot end the digits"));
      }
    }

    size_t digit_count = 0;
    for (size_t i = begin; i < end; ++i) {
      char c = input_[i];
      if (c == '_' && allow_separators) {
        continue;
      }
      if (IsSpace(c)) {
        return std::unexpected(
            Error(i, i + 1, "unexpected whitespace inside literal"));
      }
      if (!DigitValue(c, radix)) {
        return std::unexpected(Error(
            i, i + 1,
            std::format("invalid {} digit '{}'", RadixName(radix), c)));
      }
      ++digit_count;
    }

    // One spare bit keeps the accumulator from ever overflowing.
    auto magnitude = common::WideBit::FromBitWidth(
        digit_count * BitsPerDigit(radix) + 1);
    uint64_t base = RadixBase(radix);
    for (size_t i = begin; i < end; ++i) {
      char c = input_[i];
      if (c == '_') {
        continue;
      }
      magnitude.MultiplyAddSmall(base, *DigitValue(c, radix));
    }
    return magnitude;
  }

  auto Finish(
      common::WideBit magnitude, std::optional<uint32_t> width,
      size_t digits_begin, size_t digits_end) -> Result<ParsedValue> {
    if (width) {
      return ParsedValue(std::move(magnitude), *width);
    }
    uint32_t inferred = ParsedValue::MinimalWidth(magnitude);
    if (inferred > options_.max_width) {
      return std::unexpected(Error(
          digits_begin, digits_end,
          std::format(
              "value needs {} bits, exceeding the maximum of {} bits",
              inferred, options_.max_width)));
    }
    return ParsedValue(std::move(magnitude), inferred);
  }

  std::string_view input_;
  ParseOptions options_;
  size_t begin_ = 0;
  size_t end_ = 0;
};

}  // namespace

auto Parse(std::string_view text, const ParseOptions& options)
    -> Result<ParsedValue> {
  return LiteralParser(text, options).Run();
}

auto RadixName(Radix radix) -> std::string_view {
  switch (radix) {
    case Radix::kHex:
      return "hex";
    case Radix::kDecimal:
      return "decimal";
    case Radix::kBinary:
      return "binary";
  }
  return "decimal";
}

auto ParseRadixName(std::string_view name) -> std::optional<Radix> {
  if (name == "hex") {
    return Radix::kHex;
  }
  if (name == "dec" || name == "decimal") {
    return Radix::kDecimal;
  }
  if (name == "bin" || name == "binary") {
    return Radix::kBinary;
  }
  return std::nullopt;
}

}  // namespace bitlens::value
