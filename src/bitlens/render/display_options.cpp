#include "bitlens/render/display_options.hpp"

#include <optional>
#include <string_view>

namespace bitlens::render {

auto OutputFormatName(OutputFormat format) -> std::string_view {
  switch (format) {
    case OutputFormat::kHex:
      return "hex";
    case OutputFormat::kDecimal:
      return "dec";
    case OutputFormat::kBinary:
      return "bin";
  }
  return "hex";
}

auto AlignmentName(Alignment alignment) -> std::string_view {
  switch (alignment) {
    case Alignment::kByte:
      return "byte_align";
    case Alignment::kDword:
      return "dw_align";
  }
  return "byte_align";
}

auto ParseOutputFormat(std::string_view name) -> std::optional<OutputFormat> {
  if (name == "hex") {
    return OutputFormat::kHex;
  }
  if (name == "dec" || name == "decimal") {
    return OutputFormat::kDecimal;
  }
  if (name == "bin" || name == "binary") {
    return OutputFormat::kBinary;
  }
  return std::nullopt;
}

auto ParseAlignment(std::string_view name) -> std::optional<Alignment> {
  if (name == "byte_align" || name == "byte") {
    return Alignment::kByte;
  }
  if (name == "dw_align" || name == "dword") {
    return Alignment::kDword;
  }
  return std::nullopt;
}

}  // namespace bitlens::render
