#include "bitlens/field/field_map.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "bitlens/common/bit_range.hpp"
#include "bitlens/common/diagnostic.hpp"
#include "bitlens/common/internal_error.hpp"

namespace bitlens::field {

namespace {

auto EntryLabel(size_t index, const FieldDefinition& def) -> std::string {
  if (def.name.empty()) {
    return std::format("entry {}", index);
  }
  return std::format("field '{}'", def.name);
}

// Normalize one definition to a range, or explain why it is malformed.
auto ValidateRange(
    size_t index, const FieldDefinition& def, const FieldMapLimits& limits)
    -> Result<BitRange> {
  std::string label = EntryLabel(index, def);

  int64_t low = 0;
  int64_t high = 0;
  if (def.bit) {
    if (def.low || def.high) {
      return std::unexpected(Diagnostic::InvalidFieldMap(
          def.name,
          std::format("{}: give either 'bit' or 'low'/'high', not both",
                      label)));
    }
    low = *def.bit;
    high = *def.bit;
  } else {
    if (!def.low || !def.high) {
      return std::unexpected(Diagnostic::InvalidFieldMap(
          def.name,
          std::format("{}: needs both 'low' and 'high' (or a single 'bit')",
                      label)));
    }
    low = *def.low;
    high = *def.high;
  }

  if (low < 0 || high < 0) {
    return std::unexpected(Diagnostic::InvalidFieldMap(
        def.name,
        std::format("{}: bit positions must be non-negative (low {}, high {})",
                    label, low, high)));
  }
  if (low > high) {
    return std::unexpected(Diagnostic::InvalidFieldMap(
        def.name, std::format("{}: range low {} > high {}", label, low, high)));
  }
  if (high >= static_cast<int64_t>(limits.max_width)) {
    return std::unexpected(Diagnostic::InvalidFieldMap(
        def.name,
        std::format("{}: range {}-{} exceeds the maximum width of {} bits",
                    label, high, low, limits.max_width)));
  }
  return BitRange{
      .low = static_cast<uint32_t>(low), .high = static_cast<uint32_t>(high)};
}

}  // namespace

auto FieldMap::Find(std::string_view name) const -> const FieldSpec* {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) {
    return nullptr;
  }
  return &fields_[it->second];
}

auto FieldMap::Resolve(std::string_view name) const
    -> Result<const FieldSpec*> {
  const FieldSpec* spec = Find(name);
  if (spec == nullptr) {
    return std::unexpected(Diagnostic::FieldNotFound(std::string(name)));
  }
  return spec;
}

auto LoadFieldMap(
    std::span<const FieldDefinition> definitions,
    const FieldMapLimits& limits) -> Result<FieldMap> {
  FieldMap map;
  map.fields_.reserve(definitions.size());

  for (size_t i = 0; i < definitions.size(); ++i) {
    const FieldDefinition& def = definitions[i];
    if (def.name.empty()) {
      return std::unexpected(Diagnostic::InvalidFieldMap(
          "", std::format("entry {}: field name must not be empty", i)));
    }
    if (map.index_.contains(def.name)) {
      return std::unexpected(Diagnostic::InvalidFieldMap(
          def.name, std::format("duplicate field name '{}'", def.name)));
    }

    auto range = ValidateRange(i, def, limits);
    if (!range) {
      return std::unexpected(std::move(range.error()));
    }

    map.index_.emplace(def.name, map.fields_.size());
    map.fields_.push_back(FieldSpec{.name = def.name, .range = *range});
  }
  return map;
}

auto DefaultFieldDefinitions() -> std::vector<FieldDefinition> {
  return {
      {.name = "opcode", .low = 8, .high = 12, .bit = std::nullopt},
      {.name = "valid", .low = 0, .high = 3, .bit = std::nullopt},
      {.name = "flag", .low = 4, .high = 7, .bit = std::nullopt},
      {.name = "address", .low = 16, .high = 23, .bit = std::nullopt},
      {.name = "immediate", .low = 24, .high = 31, .bit = std::nullopt},
  };
}

auto DefaultFieldMap() -> FieldMap {
  auto defs = DefaultFieldDefinitions();
  auto map = LoadFieldMap(defs);
  if (!map) {
    common::ThrowInternalError("DefaultFieldMap", map.error().message);
  }
  return std::move(*map);
}

auto FieldMapStore::Load(std::span<const FieldDefinition> definitions)
    -> Result<void> {
  auto loaded = LoadFieldMap(definitions, limits_);
  if (!loaded) {
    spdlog::debug(
        "field map rejected, keeping {} existing fields: {}", current_.Size(),
        loaded.error().message);
    return std::unexpected(std::move(loaded.error()));
  }
  current_ = std::move(*loaded);
  spdlog::debug("field map replaced ({} fields)", current_.Size());
  return {};
}

}  // namespace bitlens::field
