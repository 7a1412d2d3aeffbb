#pragma once

#include <cstdint>
#include <string_view>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::analysis {

// Bits [low, high] of `value` as a new value of width high - low + 1.
// RangeOutOfBounds if low > high or high >= value.BitWidth().
auto ExtractRange(const value::ParsedValue& value, uint32_t low, uint32_t high)
    -> Result<value::ParsedValue>;

// Resolve `name` in `map` (FieldNotFound) and extract its range.
auto ExtractField(
    const value::ParsedValue& value, const field::FieldMap& map,
    std::string_view name) -> Result<value::ParsedValue>;

}  // namespace bitlens::analysis
