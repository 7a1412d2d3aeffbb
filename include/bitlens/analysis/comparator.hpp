#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bitlens/common/bit_range.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::analysis {

// Per-field comparison record. An empty v1/v2 means the field does not fit
// in that value's width (not applicable).
struct FieldDiff {
  std::string name;
  BitRange range;
  std::optional<value::ParsedValue> v1;
  std::optional<value::ParsedValue> v2;
  bool changed = false;
};

struct Diff {
  value::ParsedValue value1;
  value::ParsedValue value2;
  // Magnitudes equal (widths may differ).
  bool equal = false;
  // One record per field, in field-map order, changed or not.
  std::vector<FieldDiff> fields;
  // Ascending, merged runs of bit positions where the magnitudes differ.
  std::vector<BitRange> differing_bits;

  [[nodiscard]] auto ChangedFieldCount() const -> size_t;
};

// Total: never fails. Fields out of bounds for either value are reported as
// not applicable on that side.
auto Compare(
    const value::ParsedValue& value1, const value::ParsedValue& value2,
    const field::FieldMap& map) -> Diff;

// Text report: both values, the equality verdict, differing bit runs and the
// changed fields. Unchanged fields are omitted. No trailing newline.
auto FormatDiff(const Diff& diff, const render::DisplayOptions& options)
    -> std::string;

}  // namespace bitlens::analysis
