#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "scriptbox/cli/commands.hpp"
#include "scriptbox/core/config.hpp"

namespace scriptbox::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, resolves the effective
/// configuration (file, then environment, then command-line overrides) and
/// dispatches to the selected subcommand.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    void setup_commands();
    auto resolve_config() -> VoidResult;

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;  // empty = take it from the configuration
    std::vector<Command> commands_;
};

} // namespace scriptbox::cli
