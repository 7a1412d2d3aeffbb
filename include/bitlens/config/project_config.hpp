#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/literal_parser.hpp"

namespace bitlens::config {

inline constexpr const char* kConfigFileName = "bitlens.toml";

// Settings read from bitlens.toml. Every key is optional; unset keys leave
// the built-in defaults (or command-line flags) in effect.
struct ProjectConfig {
  std::optional<render::OutputFormat> output_format;
  std::optional<render::Alignment> alignment;
  std::optional<value::Radix> input_radix;
  // Field-map file, resolved against root_dir
  std::optional<std::filesystem::path> field_map;
  std::optional<uint32_t> max_field_width;

  // Directory where bitlens.toml was found
  std::filesystem::path root_dir;
};

// Search for bitlens.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse bitlens.toml.
// Returns a HostError diagnostic on parse errors or unrecognized values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace bitlens::config
