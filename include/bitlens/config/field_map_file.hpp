#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/field/field_map.hpp"

namespace bitlens::config {

// Decode a JSONC field-map document into unvalidated definitions.
//
// Accepted shapes (comments allowed):
//   [ {"name": "opcode", "low": 8, "high": 12}, {"name": "en", "bit": 0} ]
//   { "fields": [ ... same entries ... ] }
//
// Syntax errors are HostError; entries of the wrong shape are
// InvalidFieldMap. Range semantics are left to field::LoadFieldMap.
// `origin` names the document in messages (usually the file path).
auto DecodeFieldMap(std::string_view text, std::string_view origin)
    -> Result<std::vector<field::FieldDefinition>>;

auto ReadFieldMapFile(const std::filesystem::path& path)
    -> Result<std::vector<field::FieldDefinition>>;

}  // namespace bitlens::config
