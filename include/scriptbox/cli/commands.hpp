#pragma once

#include <functional>

#include <CLI/CLI.hpp>

#include "scriptbox/core/config.hpp"

namespace scriptbox::cli {

/// A registered subcommand and the action that runs it once the effective
/// configuration is known. The action returns the process exit code.
struct Command {
    CLI::App* sub = nullptr;
    std::function<int(Config&)> action;
    bool needs_config = true;
};

/// Register the `serve` subcommand.
/// Starts the HTTP execution service.
auto register_serve_command(CLI::App& app) -> Command;

/// Register the `check` subcommand.
/// Runs the entry-point check and the validator on a script file.
auto register_check_command(CLI::App& app) -> Command;

/// Register the `run` subcommand.
/// Executes a script file through the full pipeline and prints the reply.
auto register_run_command(CLI::App& app) -> Command;

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
auto register_config_command(CLI::App& app) -> Command;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> Command;

} // namespace scriptbox::cli
