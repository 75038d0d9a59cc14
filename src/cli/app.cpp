#include "scriptbox/cli/app.hpp"
#include "scriptbox/core/logger.hpp"

#include <filesystem>

#ifndef SCRIPTBOX_VERSION_STRING
#define SCRIPTBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace scriptbox::cli {

App::App()
    : cli_("scriptbox", "Sandboxed Python script execution service")
{
    cli_.set_version_flag("--version", SCRIPTBOX_VERSION_STRING,
                          "Display version information");

    // A missing file is not a parse error: load_config() falls back to the
    // defaults and says so.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("SCRIPTBOX_CONFIG");

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical)");

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    Logger::init("scriptbox", log_level_.empty() ? "info" : log_level_);

    for (auto& command : commands_) {
        if (!command.sub->parsed()) continue;

        if (command.needs_config) {
            if (auto resolved = resolve_config(); !resolved) {
                LOG_FATAL("Configuration error: {}", resolved.error().what());
                return 1;
            }
        }
        return command.action(config_);
    }

    // require_subcommand(1) makes this unreachable.
    return 1;
}

auto App::resolve_config() -> VoidResult {
    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        auto loaded = load_config(std::filesystem::path(config_path_));
        if (!loaded) return std::unexpected(loaded.error());
        config_ = std::move(*loaded);
    }

    if (auto env = apply_env_overrides(config_); !env) {
        return env;
    }

    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }
    Logger::set_level(config_.log_level);
    return {};
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    commands_.push_back(register_serve_command(cli_));
    commands_.push_back(register_check_command(cli_));
    commands_.push_back(register_run_command(cli_));
    commands_.push_back(register_config_command(cli_));
    commands_.push_back(register_version_command(cli_));
}

} // namespace scriptbox::cli
