#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"
#include "session.hpp"

namespace {

namespace fs = std::filesystem;

// Diagnostics and logs share stderr; stdout carries only results.
void SetUpLogging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("bitlens");
  logger->set_pattern("[%n] [%^%l%$] %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("bitlens", "0.1.0");
  program.add_description(
      "Interpret Verilog-style literals: render, slice and compare bit "
      "vectors. Starts an interactive shell when no command is given.");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  bitlens::driver::AddDisplayFlags(program);

  // Subcommand: show
  argparse::ArgumentParser show_cmd("show");
  show_cmd.add_description("Render one literal");
  show_cmd.add_argument("literal").help("Literal, e.g. 8'hA3 or 0x1A");
  show_cmd.add_argument("--breakdown")
      .default_value(false)
      .implicit_value(true)
      .help("Also print the aligned byte/dword view");
  bitlens::driver::AddDisplayFlags(show_cmd);

  // Subcommand: extract
  argparse::ArgumentParser extract_cmd("extract");
  extract_cmd.add_description("Extract a bit range or named field");
  extract_cmd.add_argument("literal").help("Literal to extract from");
  extract_cmd.add_argument("selector").help(
      "Bit range <low>-<high>, single bit, or field name");
  bitlens::driver::AddDisplayFlags(extract_cmd);

  // Subcommand: compare
  argparse::ArgumentParser compare_cmd("compare");
  compare_cmd.add_description("Compare two literals bit by bit and by field");
  compare_cmd.add_argument("literal1");
  compare_cmd.add_argument("literal2");
  bitlens::driver::AddDisplayFlags(compare_cmd);

  // Subcommand: fields
  argparse::ArgumentParser fields_cmd("fields");
  fields_cmd.add_description("List the active field map");
  bitlens::driver::AddDisplayFlags(fields_cmd);

  // Subcommand: shell
  argparse::ArgumentParser shell_cmd("shell");
  shell_cmd.add_description("Interactive shell (the default)");
  bitlens::driver::AddDisplayFlags(shell_cmd);

  program.add_subparser(show_cmd);
  program.add_subparser(extract_cmd);
  program.add_subparser(compare_cmd);
  program.add_subparser(fields_cmd);
  program.add_subparser(shell_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    bitlens::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  const argparse::ArgumentParser* used = &program;
  for (const auto* cmd :
       {&show_cmd, &extract_cmd, &compare_cmd, &fields_cmd, &shell_cmd}) {
    if (program.is_subcommand_used(*cmd)) {
      used = cmd;
    }
  }
  SetUpLogging(program.get<bool>("--verbose") || used->get<bool>("--verbose"));

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      bitlens::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
    spdlog::debug("working directory {}", fs::current_path().string());
  }

  auto outer = bitlens::driver::ReadSessionFlags(program);
  if (program.is_subcommand_used(show_cmd)) {
    spdlog::debug("dispatching show");
    return bitlens::driver::ShowCommand(show_cmd, outer);
  }
  if (program.is_subcommand_used(extract_cmd)) {
    spdlog::debug("dispatching extract");
    return bitlens::driver::ExtractCommand(extract_cmd, outer);
  }
  if (program.is_subcommand_used(compare_cmd)) {
    spdlog::debug("dispatching compare");
    return bitlens::driver::CompareCommand(compare_cmd, outer);
  }
  if (program.is_subcommand_used(fields_cmd)) {
    spdlog::debug("dispatching fields");
    return bitlens::driver::FieldsCommand(fields_cmd, outer);
  }
  if (program.is_subcommand_used(shell_cmd)) {
    spdlog::debug("dispatching shell");
    return bitlens::driver::ShellCommand(shell_cmd, outer);
  }

  // No subcommand: shell with the top-level display flags
  spdlog::debug("dispatching shell");
  return bitlens::driver::ShellCommand(program);
}
