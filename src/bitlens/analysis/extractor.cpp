#include "bitlens/analysis/extractor.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <string_view>
#include <utility>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::analysis {

auto ExtractRange(const value::ParsedValue& value, uint32_t low, uint32_t high)
    -> Result<value::ParsedValue> {
  if (low > high) {
    return std::unexpected(Diagnostic::RangeOutOfBounds(
        std::format("invalid bit range: low {} > high {}", low, high)));
  }
  if (high >= value.BitWidth()) {
    return std::unexpected(Diagnostic::RangeOutOfBounds(std::format(
        "bit range {}-{} exceeds {}-bit value", high, low, value.BitWidth())));
  }
  uint32_t width = high - low + 1;
  return value::ParsedValue(value.Magnitude().ExtractSlice(low, width), width);
}

auto ExtractField(
    const value::ParsedValue& value, const field::FieldMap& map,
    std::string_view name) -> Result<value::ParsedValue> {
  auto spec = map.Resolve(name);
  if (!spec) {
    return std::unexpected(std::move(spec.error()));
  }
  const BitRange& range = (*spec)->range;
  auto extracted = ExtractRange(value, range.low, range.high);
  if (!extracted) {
    return std::unexpected(
        std::move(extracted.error())
            .WithNote(std::format(
                "field '{}' covers bits {}", name, FormatBitRange(range))));
  }
  return extracted;
}

}  // namespace bitlens::analysis
