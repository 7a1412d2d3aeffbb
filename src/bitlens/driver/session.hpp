#pragma once

#include <argparse/argparse.hpp>
#include <optional>
#include <string>

#include "bitlens/common/diagnostic.hpp"
#include "bitlens/config/project_config.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/literal_parser.hpp"

namespace bitlens::driver {

// Everything a command needs to interpret literals: how to parse bare digits,
// how to display results, and the active field map.
struct Session {
  render::DisplayOptions display;
  value::ParseOptions parse;
  field::FieldMapStore fields;
};

// Display flags as given on the command line, unvalidated.
struct SessionFlags {
  std::optional<std::string> format;
  std::optional<std::string> align;
  std::optional<std::string> input;
  std::optional<std::string> field_map;
};

// Add --format, --align, --input, --field-map, --verbose to a command.
void AddDisplayFlags(argparse::ArgumentParser& cmd);

auto ReadSessionFlags(const argparse::ArgumentParser& cmd) -> SessionFlags;

// Flags given before the subcommand fill in whatever the subcommand's own
// flags leave unset.
auto MergeSessionFlags(const SessionFlags& outer, SessionFlags inner)
    -> SessionFlags;

// Find and load bitlens.toml from the working directory upward.
// nullopt if there is none; HostError if it exists but is invalid.
auto LoadOptionalConfig()
    -> Result<std::optional<config::ProjectConfig>>;

// Merge built-in defaults, the config file and flags (flags win), then load
// the field-map file if one is named.
auto BuildSession(
    const SessionFlags& flags,
    const std::optional<config::ProjectConfig>& config) -> Result<Session>;

}  // namespace bitlens::driver
