#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bitlens/common/bit_range.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::render {

// One alignment unit of a value: its index counted from bit 0, the absolute
// bits it covers and its sub-value. The top unit of a value whose width is
// not a multiple of the unit is partial: its range ends at bit_width - 1.
struct BitSlice {
  uint32_t index = 0;
  BitRange range;
  uint64_t value = 0;

  auto operator==(const BitSlice&) const -> bool = default;
};

// One 32-bit word with its aggregate value and its bytes (highest first).
struct WordGroup {
  BitSlice word;
  std::vector<BitSlice> bytes;

  auto operator==(const WordGroup&) const -> bool = default;
};

// Single-line rendering of the whole value.
//   hex:     <w>'h, digits padded to whole units, '_' between units
//   decimal: plain magnitude
//   binary:  <w>'b, all w bits, '_' at every unit boundary from bit 0
auto Render(const value::ParsedValue& value, const DisplayOptions& options)
    -> std::string;

// Bytes of the value, highest first.
auto SliceBytes(const value::ParsedValue& value) -> std::vector<BitSlice>;

// 32-bit words of the value, highest first.
auto SliceWords(const value::ParsedValue& value) -> std::vector<WordGroup>;

// Multi-line aligned byte/word view, highest unit first, ending with a
// "--- Total ... ---" summary line. No trailing newline.
auto RenderBreakdown(
    const value::ParsedValue& value, const DisplayOptions& options)
    -> std::string;

// Format a sub-value of `width` bits (width <= 64) as "<w>'h..", decimal, or
// "<w>'b..".
auto FormatSubValue(uint64_t value, uint32_t width, OutputFormat format)
    -> std::string;

}  // namespace bitlens::render
