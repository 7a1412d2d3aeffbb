#include "session.hpp"

#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "bitlens/common/diagnostic.hpp"
#include "bitlens/config/field_map_file.hpp"
#include "bitlens/config/project_config.hpp"
#include "bitlens/field/field_map.hpp"
#include "bitlens/render/display_options.hpp"
#include "bitlens/value/literal_parser.hpp"

namespace bitlens::driver {

namespace fs = std::filesystem;

void AddDisplayFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--format").help("Output format: hex, dec or bin");
  cmd.add_argument("--align").help("Alignment: byte_align or dw_align");
  cmd.add_argument("--input").help("Radix of bare digits: hex, dec or bin");
  cmd.add_argument("--field-map").help("JSONC field map file").metavar("FILE");
  cmd.add_argument("--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log config and field map activity to stderr");
}

auto ReadSessionFlags(const argparse::ArgumentParser& cmd) -> SessionFlags {
  return SessionFlags{
      .format = cmd.present("--format"),
      .align = cmd.present("--align"),
      .input = cmd.present("--input"),
      .field_map = cmd.present("--field-map"),
  };
}

auto MergeSessionFlags(const SessionFlags& outer, SessionFlags inner)
    -> SessionFlags {
  if (!inner.format) {
    inner.format = outer.format;
  }
  if (!inner.align) {
    inner.align = outer.align;
  }
  if (!inner.input) {
    inner.input = outer.input;
  }
  if (!inner.field_map) {
    inner.field_map = outer.field_map;
  }
  return inner;
}

auto LoadOptionalConfig() -> Result<std::optional<config::ProjectConfig>> {
  auto config_path = config::FindConfig();
  if (!config_path) {
    spdlog::debug("no {} found", config::kConfigFileName);
    return std::nullopt;
  }
  spdlog::debug("using config {}", config_path->string());
  auto config = config::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::optional<config::ProjectConfig>{std::move(*config)};
}

auto BuildSession(
    const SessionFlags& flags,
    const std::optional<config::ProjectConfig>& config) -> Result<Session> {
  render::DisplayOptions display;
  value::ParseOptions parse;
  field::FieldMapLimits limits;
  std::optional<fs::path> field_map_path;

  if (config) {
    display.output_format =
        config->output_format.value_or(display.output_format);
    display.alignment = config->alignment.value_or(display.alignment);
    parse.bare_radix = config->input_radix.value_or(parse.bare_radix);
    limits.max_width = config->max_field_width.value_or(limits.max_width);
    field_map_path = config->field_map;
  }

  if (flags.format) {
    auto format = render::ParseOutputFormat(*flags.format);
    if (!format) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "unknown format '{}', use hex, dec or bin", *flags.format)));
    }
    display.output_format = *format;
  }
  if (flags.align) {
    auto alignment = render::ParseAlignment(*flags.align);
    if (!alignment) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "unknown alignment '{}', use byte_align or dw_align",
                  *flags.align)));
    }
    display.alignment = *alignment;
  }
  if (flags.input) {
    auto radix = value::ParseRadixName(*flags.input);
    if (!radix) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "unknown input radix '{}', use hex, dec or bin",
                  *flags.input)));
    }
    parse.bare_radix = *radix;
  }
  if (flags.field_map) {
    field_map_path = fs::absolute(*flags.field_map);
  }

  if (!field_map_path) {
    // The built-in map must still satisfy a narrowed max_width
    auto builtin =
        field::LoadFieldMap(field::DefaultFieldDefinitions(), limits);
    if (!builtin) {
      return std::unexpected(
          std::move(builtin.error())
              .WithNote(
                  std::format(
                      "the built-in field map needs max_width of at least "
                      "32, got {}",
                      limits.max_width)));
    }
    return Session{
        .display = display,
        .parse = parse,
        .fields = field::FieldMapStore(std::move(*builtin), limits),
    };
  }

  Session session{
      .display = display,
      .parse = parse,
      .fields = field::FieldMapStore(field::FieldMap{}, limits),
  };
  spdlog::debug("loading field map {}", field_map_path->string());
  auto definitions = config::ReadFieldMapFile(*field_map_path);
  if (!definitions) {
    return std::unexpected(std::move(definitions.error()));
  }
  auto loaded = session.fields.Load(*definitions);
  if (!loaded) {
    return std::unexpected(
        std::move(loaded.error())
            .WithNote(
                std::format("while loading {}", field_map_path->string())));
  }
  return session;
}

}  // namespace bitlens::driver
