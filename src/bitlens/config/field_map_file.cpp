#include "bitlens/config/field_map_file.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/field/field_map.hpp"

namespace bitlens::config {

namespace {

using Json = nlohmann::json;

// Read an optional integer member. Absent gives nullopt; present but not an
// integer (or beyond int64) is an error message.
auto ReadBound(const Json& entry, const char* key, std::string_view where)
    -> std::expected<std::optional<int64_t>, std::string> {
  auto it = entry.find(key);
  if (it == entry.end()) {
    return std::optional<int64_t>{};
  }
  if (it->is_number_unsigned()) {
    auto raw = it->get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return std::unexpected(
          std::format("{}: '{}' is out of range", where, key));
    }
    return std::optional<int64_t>{static_cast<int64_t>(raw)};
  }
  if (it->is_number_integer()) {
    return std::optional<int64_t>{it->get<int64_t>()};
  }
  return std::unexpected(
      std::format("{}: '{}' must be an integer", where, key));
}

}  // namespace

auto DecodeFieldMap(std::string_view text, std::string_view origin)
    -> Result<std::vector<field::FieldDefinition>> {
  Json root;
  try {
    root = Json::parse(
        std::string(text), /*cb=*/nullptr, /*allow_exceptions=*/true,
        /*ignore_comments=*/true);
  } catch (const Json::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("failed to parse {}: {}", origin, e.what())));
  }

  const Json* entries = &root;
  if (root.is_object()) {
    auto it = root.find("fields");
    if (it == root.end()) {
      return std::unexpected(
          Diagnostic::InvalidFieldMap(
              "", std::format("{}: missing 'fields' array", origin)));
    }
    entries = &*it;
  }
  if (!entries->is_array()) {
    return std::unexpected(
        Diagnostic::InvalidFieldMap(
            "", std::format("{}: expected an array of field entries", origin)));
  }

  std::vector<field::FieldDefinition> definitions;
  definitions.reserve(entries->size());
  for (size_t i = 0; i < entries->size(); ++i) {
    const Json& entry = (*entries)[i];
    std::string where = std::format("{}: entry {}", origin, i);
    if (!entry.is_object()) {
      return std::unexpected(
          Diagnostic::InvalidFieldMap(
              "", std::format("{} must be an object", where)));
    }

    field::FieldDefinition def;
    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string()) {
      return std::unexpected(
          Diagnostic::InvalidFieldMap(
              "", std::format("{}: 'name' must be a string", where)));
    }
    def.name = name->get<std::string>();

    for (auto [key, slot] :
         {std::pair{"low", &def.low}, std::pair{"high", &def.high},
          std::pair{"bit", &def.bit}}) {
      auto bound = ReadBound(entry, key, where);
      if (!bound) {
        return std::unexpected(
            Diagnostic::InvalidFieldMap(def.name, std::move(bound.error())));
      }
      *slot = *bound;
    }
    definitions.push_back(std::move(def));
  }
  return definitions;
}

auto ReadFieldMapFile(const std::filesystem::path& path)
    -> Result<std::vector<field::FieldDefinition>> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open field map '{}'", path.string())));
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return DecodeFieldMap(contents.str(), path.string());
}

}  // namespace bitlens::config
