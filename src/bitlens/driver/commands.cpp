#include "commands.hpp"

#include <expected>
#include <iostream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <unistd.h>

#include "argparse/argparse.hpp"
#include "bitlens/analysis/comparator.hpp"
#include "bitlens/analysis/extractor.hpp"
#include "bitlens/common/diagnostic.hpp"
#include "bitlens/render/renderer.hpp"
#include "bitlens/value/literal_parser.hpp"
#include "print.hpp"
#include "report.hpp"
#include "session.hpp"
#include "shell.hpp"

namespace bitlens::driver {

namespace {

auto PrepareSession(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer)
    -> Result<Session> {
  auto config = LoadOptionalConfig();
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  auto session = BuildSession(
      MergeSessionFlags(outer, ReadSessionFlags(cmd)), *config);
  if (session && session->fields.Current().IsEmpty()) {
    PrintWarning("the active field map defines no fields");
  }
  return session;
}

}  // namespace

auto ShowCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer) -> int {
  auto session = PrepareSession(cmd, outer);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  auto literal = cmd.get<std::string>("literal");
  auto parsed = value::Parse(literal, session->parse);
  if (!parsed) {
    PrintDiagnostic(parsed.error());
    return 1;
  }

  std::cout << render::Render(*parsed, session->display) << "\n";
  if (cmd.get<bool>("--breakdown")) {
    std::cout << render::RenderBreakdown(*parsed, session->display) << "\n";
  }
  return 0;
}

auto ExtractCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer) -> int {
  auto session = PrepareSession(cmd, outer);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  auto literal = cmd.get<std::string>("literal");
  auto parsed = value::Parse(literal, session->parse);
  if (!parsed) {
    PrintDiagnostic(parsed.error());
    return 1;
  }

  // A bit selector wins over a field of the same spelling
  auto selector = cmd.get<std::string>("selector");
  if (auto range = ParseBitSelector(selector)) {
    auto extracted = analysis::ExtractRange(*parsed, range->low, range->high);
    if (!extracted) {
      PrintDiagnostic(extracted.error());
      return 1;
    }
    std::cout << FormatExtraction(*range, "", *extracted, session->display)
              << "\n";
    return 0;
  }

  const auto& map = session->fields.Current();
  auto extracted = analysis::ExtractField(*parsed, map, selector);
  if (!extracted) {
    PrintDiagnostic(extracted.error());
    return 1;
  }
  const auto* spec = map.Find(selector);
  std::cout << FormatExtraction(
                   spec->range, spec->name, *extracted, session->display)
            << "\n";
  return 0;
}

auto CompareCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer) -> int {
  auto session = PrepareSession(cmd, outer);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  auto first = value::Parse(cmd.get<std::string>("literal1"), session->parse);
  if (!first) {
    PrintDiagnostic(first.error());
    return 1;
  }
  auto second = value::Parse(cmd.get<std::string>("literal2"), session->parse);
  if (!second) {
    PrintDiagnostic(second.error());
    return 1;
  }

  auto diff = analysis::Compare(*first, *second, session->fields.Current());
  spdlog::debug(
      "compare: {} differing bit runs, {} changed fields",
      diff.differing_bits.size(), diff.ChangedFieldCount());
  std::cout << analysis::FormatDiff(diff, session->display) << "\n";
  return 0;
}

auto FieldsCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer) -> int {
  auto session = PrepareSession(cmd, outer);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }
  std::cout << FormatFieldListing(
                   session->fields.Current(), nullptr, session->display)
            << "\n";
  return 0;
}

auto ShellCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer) -> int {
  auto session = PrepareSession(cmd, outer);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }

  bool interactive = isatty(STDIN_FILENO) != 0;
  Shell shell(*session, std::cout, std::cerr, isatty(STDERR_FILENO) != 0);
  shell.Run(std::cin, interactive);
  if (!interactive && shell.ErrorCount() > 0) {
    return 1;
  }
  return 0;
}

}  // namespace bitlens::driver
