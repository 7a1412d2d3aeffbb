#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::value {

enum class Radix : uint8_t { kHex, kDecimal, kBinary };

struct ParseOptions {
  // Radix of a literal with no prefix at all ("26", "ff", "1010").
  Radix bare_radix = Radix::kDecimal;
  // Largest explicit or inferred width accepted.
  uint32_t max_width = 65536;
};

// Parse one literal. Accepted forms, first match wins:
//   <width>'<h|b|d><digits>   explicit width, magnitude masked to it
//   '<h|b|d><digits>          width inferred
//   0x<hex> / 0b<bin>         width inferred
//   <digits>                  bare digits in options.bare_radix
// `_` may separate digits in the two Verilog forms only. Inferred widths are
// the magnitude's bit count rounded up to a byte, at least 8. Surrounding
// whitespace is ignored.
auto Parse(std::string_view text, const ParseOptions& options = {})
    -> Result<ParsedValue>;

auto RadixName(Radix radix) -> std::string_view;

// Accepts "hex", "dec", "decimal", "bin", "binary".
auto ParseRadixName(std::string_view name) -> std::optional<Radix>;

}  // namespace bitlens::value
