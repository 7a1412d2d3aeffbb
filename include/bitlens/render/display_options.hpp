#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bitlens::render {

enum class OutputFormat : uint8_t { kHex, kDecimal, kBinary };

enum class Alignment : uint8_t {
  kByte,   // byte_align: 8-bit units
  kDword,  // dw_align: 32-bit units
};

// Presentation only; never affects parsing or numeric results.
struct DisplayOptions {
  OutputFormat output_format = OutputFormat::kHex;
  Alignment alignment = Alignment::kByte;

  auto operator==(const DisplayOptions&) const -> bool = default;
};

constexpr uint32_t kByteBits = 8;
constexpr uint32_t kDwordBits = 32;

constexpr auto UnitBits(Alignment alignment) -> uint32_t {
  return alignment == Alignment::kDword ? kDwordBits : kByteBits;
}

auto OutputFormatName(OutputFormat format) -> std::string_view;
auto AlignmentName(Alignment alignment) -> std::string_view;

// "hex", "dec"/"decimal", "bin"/"binary"
auto ParseOutputFormat(std::string_view name) -> std::optional<OutputFormat>;
// "byte_align"/"byte", "dw_align"/"dword"
auto ParseAlignment(std::string_view name) -> std::optional<Alignment>;

}  // namespace bitlens::render
