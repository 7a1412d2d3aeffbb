#include "bitlens/config/project_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <toml++/toml.hpp>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/literal_parser.hpp"

namespace bitlens::config {

namespace fs = std::filesystem;

namespace {

auto WrongType(
    const fs::path& config_path, std::string_view name, std::string_view type)
    -> Diagnostic {
  return Diagnostic::HostError(
      std::format("{}: {} must be {}", config_path.string(), name, type));
}

auto CheckSection(
    const toml::table& tbl, std::string_view section,
    const fs::path& config_path) -> Result<bool> {
  auto node = tbl[section];
  if (!node) {
    return false;
  }
  if (!node.is_table()) {
    return std::unexpected(WrongType(config_path, section, "a table"));
  }
  return true;
}

// Absent keys are nullopt. A key holding the wrong TOML type is a HostError.
template <typename T>
auto ReadKey(
    const toml::table& tbl, std::string_view section, std::string_view key,
    const fs::path& config_path) -> Result<std::optional<T>> {
  auto node = tbl[section][key];
  if (!node) {
    return std::nullopt;
  }
  if (auto value = node.value_exact<T>()) {
    return std::optional<T>{std::move(*value)};
  }
  return std::unexpected(WrongType(
      config_path, std::format("{}.{}", section, key),
      std::is_same_v<T, std::string> ? "a string" : "an integer"));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}: {}", config_path.string(), e.what())));
  }

  for (std::string_view section : {"display", "input", "fields"}) {
    auto present = CheckSection(tbl, section, config_path);
    if (!present) {
      return std::unexpected(std::move(present.error()));
    }
  }

  // [display] section
  auto format = ReadKey<std::string>(tbl, "display", "format", config_path);
  if (!format) {
    return std::unexpected(std::move(format.error()));
  }
  if (*format) {
    config.output_format = render::ParseOutputFormat(**format);
    if (!config.output_format) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: unknown display.format '{}', use hex, dec or bin",
                  config_path.string(), **format)));
    }
  }
  auto align = ReadKey<std::string>(tbl, "display", "align", config_path);
  if (!align) {
    return std::unexpected(std::move(align.error()));
  }
  if (*align) {
    config.alignment = render::ParseAlignment(**align);
    if (!config.alignment) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: unknown display.align '{}', use byte_align or "
                  "dw_align",
                  config_path.string(), **align)));
    }
  }

  // [input] section
  auto radix = ReadKey<std::string>(tbl, "input", "radix", config_path);
  if (!radix) {
    return std::unexpected(std::move(radix.error()));
  }
  if (*radix) {
    config.input_radix = value::ParseRadixName(**radix);
    if (!config.input_radix) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: unknown input.radix '{}', use hex, dec or bin",
                  config_path.string(), **radix)));
    }
  }

  // [fields] section
  auto map = ReadKey<std::string>(tbl, "fields", "map", config_path);
  if (!map) {
    return std::unexpected(std::move(map.error()));
  }
  if (*map) {
    fs::path map_path = **map;
    if (map_path.is_relative()) {
      map_path = config.root_dir / map_path;
    }
    config.field_map = map_path;
  }
  auto max_width = ReadKey<int64_t>(tbl, "fields", "max_width", config_path);
  if (!max_width) {
    return std::unexpected(std::move(max_width.error()));
  }
  if (*max_width) {
    if (**max_width <= 0 || **max_width > UINT32_MAX) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: fields.max_width must be a positive integer, got {}",
                  config_path.string(), **max_width)));
    }
    config.max_field_width = static_cast<uint32_t>(**max_width);
  }

  return config;
}

}  // namespace bitlens::config
