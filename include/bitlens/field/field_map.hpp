#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bitlens/common/bit_range.hpp"
#include "bitlens/common/diagnostic.hpp"

namespace bitlens::field {

// One named bit field. Names are case-sensitive and unique within a map;
// ranges may overlap.
struct FieldSpec {
  std::string name;
  BitRange range;

  auto operator==(const FieldSpec&) const -> bool = default;
};

// One entry as decoded from an external source, before validation.
// Exactly one of {bit} or {low, high} is expected; bounds are signed so a
// decoder can pass negative or oversized numbers through for rejection.
struct FieldDefinition {
  std::string name;
  std::optional<int64_t> low;
  std::optional<int64_t> high;
  std::optional<int64_t> bit;
};

struct FieldMapLimits {
  // Every field must satisfy high < max_width.
  uint32_t max_width = 1024;
};

class FieldMap;

// Validate `definitions` as a whole and build a map from them. Any bad entry
// fails the entire load with InvalidFieldMap naming the cause.
auto LoadFieldMap(
    std::span<const FieldDefinition> definitions,
    const FieldMapLimits& limits = {}) -> Result<FieldMap>;

// Ordered, validated collection of fields. Insertion order is preserved so
// listings and compare reports are deterministic.
class FieldMap {
 public:
  FieldMap() = default;

  // Returns FieldNotFound if no field has this exact name.
  [[nodiscard]] auto Resolve(std::string_view name) const
      -> Result<const FieldSpec*>;

  [[nodiscard]] auto Find(std::string_view name) const -> const FieldSpec*;

  [[nodiscard]] auto All() const -> std::span<const FieldSpec> {
    return fields_;
  }
  [[nodiscard]] auto Size() const -> size_t {
    return fields_.size();
  }
  [[nodiscard]] auto IsEmpty() const -> bool {
    return fields_.empty();
  }

  auto operator==(const FieldMap& other) const -> bool {
    return fields_ == other.fields_;
  }

 private:
  friend auto LoadFieldMap(
      std::span<const FieldDefinition> definitions,
      const FieldMapLimits& limits) -> Result<FieldMap>;

  std::vector<FieldSpec> fields_;
  std::unordered_map<std::string, size_t> index_;
};

// The built-in map used when no field-map file is configured.
auto DefaultFieldDefinitions() -> std::vector<FieldDefinition>;
auto DefaultFieldMap() -> FieldMap;

// Holds the active field map. Load() builds the replacement completely and
// swaps it in only on success, so readers never observe a partial map and a
// rejected load leaves the previous map in place. Not thread-safe.
class FieldMapStore {
 public:
  // Starts with the built-in map.
  FieldMapStore() : current_(DefaultFieldMap()) {
  }

  explicit FieldMapStore(FieldMap initial, FieldMapLimits limits = {})
      : current_(std::move(initial)), limits_(limits) {
  }

  auto Load(std::span<const FieldDefinition> definitions) -> Result<void>;

  [[nodiscard]] auto Current() const -> const FieldMap& {
    return current_;
  }
  [[nodiscard]] auto Limits() const -> const FieldMapLimits& {
    return limits_;
  }

 private:
  FieldMap current_;
  FieldMapLimits limits_;
};

}  // namespace bitlens::field
