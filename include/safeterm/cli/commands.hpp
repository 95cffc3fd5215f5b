#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "safeterm/core/config.hpp"

namespace safeterm::cli {

/// Register the `shell` subcommand.
/// Starts the interactive command loop on stdin/stdout.
auto register_shell_command(CLI::App& app) -> CLI::App*;

/// Register the `run` subcommand.
/// Everything after `run` is taken verbatim as one command line.
auto register_run_command(CLI::App& app) -> CLI::App*;

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
auto register_config_command(CLI::App& app, bool& validate_only) -> CLI::App*;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> CLI::App*;

auto run_shell(const Config& config) -> int;

/// Executes `words` as a single shell command. Returns 1 if the command
/// failed, 0 otherwise.
auto run_once(const Config& config, const std::vector<std::string>& words) -> int;

/// Prints the configuration as JSON, or with `validate_only` checks that
/// the allowed root is an existing directory without creating anything.
auto show_config(const Config& config, bool validate_only) -> int;

auto print_version() -> int;

} // namespace safeterm::cli
