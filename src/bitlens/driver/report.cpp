#include "report.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "bitlens/analysis/extractor.hpp"
#include "bitlens/common/bit_range.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/render/renderer.hpp"
#include "bitlens/value/parsed_value.hpp"

namespace bitlens::driver {

namespace {

auto ParseBitIndex(std::string_view text) -> std::optional<uint32_t> {
  if (text.empty()) {
    return std::nullopt;
  }
  uint32_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto ParseBitSelector(std::string_view text) -> std::optional<BitRange> {
  auto dash = text.find('-');
  if (dash == std::string_view::npos) {
    auto bit = ParseBitIndex(text);
    if (!bit) {
      return std::nullopt;
    }
    return BitRange{.low = *bit, .high = *bit};
  }
  auto first = ParseBitIndex(text.substr(0, dash));
  auto second = ParseBitIndex(text.substr(dash + 1));
  if (!first || !second) {
    return std::nullopt;
  }
  return BitRange{
      .low = std::min(*first, *second), .high = std::max(*first, *second)};
}

auto FormatExtraction(
    const BitRange& range, std::string_view field_name,
    const value::ParsedValue& extracted, const render::DisplayOptions& options)
    -> std::string {
  std::string label = fmt::format("bit {}", FormatBitRange(range));
  if (!field_name.empty()) {
    label += fmt::format(" [{}]", field_name);
  }
  render::DisplayOptions binary{
      .output_format = render::OutputFormat::kBinary,
      .alignment = options.alignment};
  return fmt::format(
      "{} = {} (dec = {})", label, render::Render(extracted, binary),
      extracted.Magnitude().ToDecimalString());
}

auto FormatFieldListing(
    const field::FieldMap& map, const value::ParsedValue* value,
    const render::DisplayOptions& options) -> std::string {
  if (map.IsEmpty()) {
    return "No fields defined.";
  }

  std::string out =
      value == nullptr ? "Fields:" : "Last parsed value per field:";
  for (const auto& spec : map.All()) {
    if (value == nullptr) {
      out += fmt::format(
          "\n  {}: bit {}", spec.name, FormatBitRange(spec.range));
      continue;
    }
    auto extracted =
        analysis::ExtractRange(*value, spec.range.low, spec.range.high);
    if (!extracted) {
      out += fmt::format(
          "\n  {}: n/a (bit {} exceeds {}-bit value)", spec.name,
          FormatBitRange(spec.range), value->BitWidth());
      continue;
    }
    out += fmt::format(
        "\n  {}: {}", spec.name,
        FormatExtraction(spec.range, "", *extracted, options));
  }
  return out;
}

}  // namespace bitlens::driver
