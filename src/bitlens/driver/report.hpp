#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "bitlens/common/bit_range.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::driver {

// "<a>-<b>" (bounds in either order) or a single "<bit>". Returns nullopt if
// the text is not a bit selector at all.
auto ParseBitSelector(std::string_view text) -> std::optional<BitRange>;

// "bit 7-4 [flag] = 4'b1010 (dec = 10)"
auto FormatExtraction(
    const BitRange& range, std::string_view field_name,
    const value::ParsedValue& extracted, const render::DisplayOptions& options)
    -> std::string;

// Field listing. Without a value: one "name: bit high-low" line per field.
// With a value: each field's extracted sub-value, or n/a if it does not fit.
// No trailing newline.
auto FormatFieldListing(
    const field::FieldMap& map, const value::ParsedValue* value,
    const render::DisplayOptions& options) -> std::string;

}  // namespace bitlens::driver
