#include "bitlens/render/renderer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "bitlens/common/bit_range.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::render {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";
constexpr uint32_t kNibbleBits = 4;
constexpr uint32_t kByteGridRowBits = 8;
constexpr uint32_t kWordGridRowBits = 16;
constexpr size_t kMinGridColumn = 6;

auto CeilDiv(uint32_t value, uint32_t divisor) -> uint32_t {
  return (value + divisor - 1) / divisor;
}

auto MakeSlice(const value::ParsedValue& value, uint32_t index, uint32_t bits)
    -> BitSlice {
  uint32_t low = index * bits;
  uint32_t high = std::min(low + bits - 1, value.BitWidth() - 1);
  return BitSlice{
      .index = index,
      .range = BitRange{.low = low, .high = high},
      .value = value.ReadBits(low, high - low + 1),
  };
}

auto RenderHex(const value::ParsedValue& value, uint32_t unit_bits)
    -> std::string {
  uint32_t width = value.BitWidth();
  uint32_t digits = CeilDiv(width, unit_bits) * unit_bits / kNibbleBits;
  uint32_t digits_per_unit = unit_bits / kNibbleBits;

  std::string out = fmt::format("{}'h", width);
  out.reserve(out.size() + digits + digits / digits_per_unit);
  for (uint32_t i = digits; i > 0; --i) {
    uint32_t nibble = i - 1;
    out += kHexDigits[value.ReadBits(nibble * kNibbleBits, kNibbleBits)];
    if (nibble != 0 && nibble % digits_per_unit == 0) {
      out += '_';
    }
  }
  return out;
}

auto RenderBinary(const value::ParsedValue& value, uint32_t unit_bits)
    -> std::string {
  uint32_t width = value.BitWidth();
  std::string out = fmt::format("{}'b", width);
  out.reserve(out.size() + width + width / unit_bits);
  for (uint32_t i = width; i > 0; --i) {
    uint32_t bit = i - 1;
    out += value.Bit(bit) ? '1' : '0';
    if (bit != 0 && bit % unit_bits == 0) {
      out += '_';
    }
  }
  return out;
}

auto SliceLabel(std::string_view kind, const BitSlice& slice) -> std::string {
  return fmt::format(
      "{}{} [{}]", kind, slice.index, FormatBitRange(slice.range));
}

// Bit labels on one row, values under them, `row_bits` bits per row starting
// from the top of the slice.
void AppendBitGrid(
    std::vector<std::string>& lines, const value::ParsedValue& value,
    const BitSlice& slice, std::string_view label_prefix, uint32_t row_bits,
    std::string_view indent) {
  size_t column = std::max(
      kMinGridColumn,
      fmt::format("{}{}", label_prefix, slice.range.high).size() + 1);

  uint32_t top = slice.range.high + 1;
  while (top > slice.range.low) {
    uint32_t row_low = top > slice.range.low + row_bits ? top - row_bits
                                                        : slice.range.low;
    std::string labels(indent);
    std::string bits(indent);
    for (uint32_t i = top; i > row_low; --i) {
      uint32_t bit = i - 1;
      labels += fmt::format(
          "{:>{}}", fmt::format("{}{}", label_prefix, bit), column);
      bits += fmt::format("{:>{}}", value.Bit(bit) ? "1" : "0", column);
    }
    lines.push_back(std::move(labels));
    lines.push_back(std::move(bits));
    top = row_low;
  }
}

auto JoinLines(const std::vector<std::string>& lines) -> std::string {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0) {
      out += '\n';
    }
    out += lines[i];
  }
  return out;
}

auto RenderByteBreakdown(
    const value::ParsedValue& value, OutputFormat format) -> std::string {
  auto bytes = SliceBytes(value);

  std::vector<std::string> labels;
  labels.reserve(bytes.size());
  size_t label_width = 0;
  for (const auto& slice : bytes) {
    labels.push_back(SliceLabel("byte", slice));
    label_width = std::max(label_width, labels.back().size());
  }

  std::vector<std::string> lines;
  for (size_t i = 0; i < bytes.size(); ++i) {
    const BitSlice& slice = bytes[i];
    lines.push_back(fmt::format(
        "{:<{}}  {}", labels[i], label_width,
        FormatSubValue(slice.value, slice.range.Width(), format)));
    if (format == OutputFormat::kBinary) {
      AppendBitGrid(lines, value, slice, "bit", kByteGridRowBits, "  ");
    }
  }
  lines.push_back(fmt::format("--- Total {} bytes ---", bytes.size()));
  return JoinLines(lines);
}

auto RenderWordBreakdown(
    const value::ParsedValue& value, OutputFormat format) -> std::string {
  auto words = SliceWords(value);

  size_t word_label_width = 0;
  size_t byte_label_width = 0;
  for (const auto& group : words) {
    word_label_width =
        std::max(word_label_width, SliceLabel("dw", group.word).size());
    for (const auto& byte : group.bytes) {
      byte_label_width =
          std::max(byte_label_width, SliceLabel("byte", byte).size());
    }
  }

  std::vector<std::string> lines;
  uint32_t byte_count = 0;
  for (const auto& group : words) {
    byte_count += static_cast<uint32_t>(group.bytes.size());
    lines.push_back(fmt::format(
        "{:<{}}  {}", SliceLabel("dw", group.word), word_label_width,
        FormatSubValue(group.word.value, group.word.range.Width(), format)));
    if (format == OutputFormat::kBinary) {
      AppendBitGrid(lines, value, group.word, "b", kWordGridRowBits, "  ");
      continue;
    }
    for (const auto& byte : group.bytes) {
      lines.push_back(fmt::format(
          "  {:<{}}  {}", SliceLabel("byte", byte), byte_label_width,
          FormatSubValue(byte.value, byte.range.Width(), format)));
    }
  }
  lines.push_back(fmt::format(
      "--- Total {} bytes, {} x 32-bit words ---", byte_count, words.size()));
  return JoinLines(lines);
}

}  // namespace

auto Render(const value::ParsedValue& value, const DisplayOptions& options)
    -> std::string {
  uint32_t unit_bits = UnitBits(options.alignment);
  switch (options.output_format) {
    case OutputFormat::kHex:
      return RenderHex(value, unit_bits);
    case OutputFormat::kDecimal:
      return value.Magnitude().ToDecimalString();
    case OutputFormat::kBinary:
      return RenderBinary(value, unit_bits);
  }
  return RenderHex(value, unit_bits);
}

auto SliceBytes(const value::ParsedValue& value) -> std::vector<BitSlice> {
  uint32_t count = CeilDiv(value.BitWidth(), kByteBits);
  std::vector<BitSlice> bytes;
  bytes.reserve(count);
  for (uint32_t i = count; i > 0; --i) {
    bytes.push_back(MakeSlice(value, i - 1, kByteBits));
  }
  return bytes;
}

auto SliceWords(const value::ParsedValue& value) -> std::vector<WordGroup> {
  uint32_t count = CeilDiv(value.BitWidth(), kDwordBits);
  std::vector<WordGroup> words;
  words.reserve(count);
  for (uint32_t i = count; i > 0; --i) {
    WordGroup group{.word = MakeSlice(value, i - 1, kDwordBits), .bytes = {}};
    uint32_t first_byte = group.word.range.low / kByteBits;
    uint32_t last_byte = group.word.range.high / kByteBits;
    for (uint32_t b = last_byte + 1; b > first_byte; --b) {
      group.bytes.push_back(MakeSlice(value, b - 1, kByteBits));
    }
    words.push_back(std::move(group));
  }
  return words;
}

auto RenderBreakdown(
    const value::ParsedValue& value, const DisplayOptions& options)
    -> std::string {
  if (options.alignment == Alignment::kDword) {
    return RenderWordBreakdown(value, options.output_format);
  }
  return RenderByteBreakdown(value, options.output_format);
}

auto FormatSubValue(uint64_t value, uint32_t width, OutputFormat format)
    -> std::string {
  switch (format) {
    case OutputFormat::kHex:
      return fmt::format(
          "{}'h{:0{}x}", width, value, CeilDiv(width, kNibbleBits));
    case OutputFormat::kDecimal:
      return fmt::format("{}", value);
    case OutputFormat::kBinary:
      return fmt::format("{}'b{:0{}b}", width, value, width);
  }
  return fmt::format("{}", value);
}

}  // namespace bitlens::render
