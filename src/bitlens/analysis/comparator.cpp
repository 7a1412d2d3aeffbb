#include "bitlens/analysis/comparator.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "bitlens/analysis/extractor.hpp"
#include "bitlens/common/bit_range.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/render/renderer.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::analysis {

namespace {

auto ExtractIfFits(const value::ParsedValue& value, const BitRange& range)
    -> std::optional<value::ParsedValue> {
  auto extracted = ExtractRange(value, range.low, range.high);
  if (!extracted) {
    return std::nullopt;
  }
  return std::move(*extracted);
}

auto CollectDifferingBits(
    const value::ParsedValue& value1, const value::ParsedValue& value2)
    -> std::vector<BitRange> {
  std::vector<BitRange> runs;
  uint32_t width = std::max(value1.BitWidth(), value2.BitWidth());
  for (uint32_t bit = 0; bit < width; ++bit) {
    if (value1.Bit(bit) == value2.Bit(bit)) {
      continue;
    }
    if (!runs.empty() && runs.back().high + 1 == bit) {
      runs.back().high = bit;
    } else {
      runs.push_back(BitRange{.low = bit, .high = bit});
    }
  }
  return runs;
}

auto FormatFieldValue(
    const std::optional<value::ParsedValue>& sub,
    const render::DisplayOptions& options) -> std::string {
  if (!sub) {
    return "n/a";
  }
  if (sub->BitWidth() <= 64) {
    return render::FormatSubValue(
        sub->ReadBits(0, sub->BitWidth()), sub->BitWidth(),
        options.output_format);
  }
  return render::Render(*sub, options);
}

void AppendDifferingBits(const Diff& diff, std::string& out) {
  size_t bit_count = 0;
  std::vector<std::string> runs;
  // Highest bits first, matching how values are rendered.
  for (auto it = diff.differing_bits.rbegin(); it != diff.differing_bits.rend();
       ++it) {
    bit_count += it->Width();
    runs.push_back(FormatBitRange(*it));
  }
  out += fmt::format(
      "Result: values differ ({} bit{})\n", bit_count,
      bit_count == 1 ? "" : "s");
  out += fmt::format("Differing bits: {}\n", fmt::join(runs, ", "));
}

}  // namespace

auto Diff::ChangedFieldCount() const -> size_t {
  return static_cast<size_t>(std::ranges::count_if(
      fields, [](const FieldDiff& f) { return f.changed; }));
}

auto Compare(
    const value::ParsedValue& value1, const value::ParsedValue& value2,
    const field::FieldMap& map) -> Diff {
  Diff diff{
      .value1 = value1,
      .value2 = value2,
      .equal = value1.SameMagnitude(value2),
      .fields = {},
      .differing_bits = CollectDifferingBits(value1, value2),
  };

  diff.fields.reserve(map.Size());
  for (const auto& spec : map.All()) {
    FieldDiff record{
        .name = spec.name,
        .range = spec.range,
        .v1 = ExtractIfFits(value1, spec.range),
        .v2 = ExtractIfFits(value2, spec.range),
        .changed = false,
    };
    record.changed = record.v1 != record.v2;
    diff.fields.push_back(std::move(record));
  }
  return diff;
}

auto FormatDiff(const Diff& diff, const render::DisplayOptions& options)
    -> std::string {
  std::string out;
  out += fmt::format("Value 1: {}\n", render::Render(diff.value1, options));
  out += fmt::format("Value 2: {}\n", render::Render(diff.value2, options));

  size_t changed = diff.ChangedFieldCount();
  if (diff.equal && changed == 0) {
    out += "Result: values are identical";
    return out;
  }

  if (diff.equal) {
    // Same magnitude, but some fields exist in only one of the widths.
    out += fmt::format(
        "Result: values are numerically equal ({} vs {} bits)\n",
        diff.value1.BitWidth(), diff.value2.BitWidth());
  } else {
    AppendDifferingBits(diff, out);
  }

  if (changed == 0) {
    out += "Changed fields: none";
    return out;
  }
  out += fmt::format(
      "Changed fields ({} of {}):", changed, diff.fields.size());
  for (const auto& field : diff.fields) {
    if (!field.changed) {
      continue;
    }
    out += fmt::format(
        "\n  {} [{}]: {} -> {}", field.name, FormatBitRange(field.range),
        FormatFieldValue(field.v1, options),
        FormatFieldValue(field.v2, options));
  }
  return out;
}

}  // namespace bitlens::analysis
