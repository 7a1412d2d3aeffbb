#pragma once

#include <argparse/argparse.hpp>

#include "session.hpp"

namespace bitlens::driver {

// Each returns the process exit code: 0 on success, 1 after printing a
// diagnostic. `outer` holds the display flags given before the subcommand.
auto ShowCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer = {})
    -> int;
auto ExtractCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer = {})
    -> int;
auto CompareCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer = {})
    -> int;
auto FieldsCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer = {})
    -> int;

// Interactive when stdin is a terminal. Reading a script from a pipe exits
// with 1 if any line failed.
auto ShellCommand(
    const argparse::ArgumentParser& cmd, const SessionFlags& outer = {})
    -> int;

}  // namespace bitlens::driver
