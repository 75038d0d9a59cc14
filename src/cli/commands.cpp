#include "scriptbox/cli/commands.hpp"
#include "scriptbox/core/logger.hpp"
#include "scriptbox/exec/harness.hpp"
#include "scriptbox/exec/process.hpp"
#include "scriptbox/server/http_server.hpp"
#include "scriptbox/service/pipeline.hpp"
#include "scriptbox/validation/rule_set.hpp"
#include "scriptbox/validation/validator.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#ifndef SCRIPTBOX_VERSION_STRING
#define SCRIPTBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace scriptbox::cli {

namespace {

auto read_script(const std::string& path) -> Result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError, "Cannot open script", path));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

auto build_rules(const Config& config) -> Result<validation::RuleSetPtr> {
    auto rules = validation::RuleSet::from_config(config.rules);
    if (!rules) return std::unexpected(rules.error());
    return std::make_shared<const validation::RuleSet>(std::move(*rules));
}

void warn_if_sandbox_missing(const Config& config) {
    if (config.sandbox.executable.empty()) return;
    if (exec::resolve_executable(config.sandbox.executable).empty()) {
        LOG_WARN("Sandbox executable '{}' not found; every execution will fail",
                 config.sandbox.executable);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

auto register_serve_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("serve", "Start the HTTP execution service");

    struct Overrides {
        uint16_t port = 0;
        std::string bind;
    };
    auto overrides = std::make_shared<Overrides>();

    sub->add_option("-p,--port", overrides->port, "Listen port (overrides config)");
    sub->add_option("-b,--bind", overrides->bind, "Bind address (overrides config)");

    auto action = [overrides](Config& config) -> int {
        if (overrides->port != 0) {
            config.server.port = overrides->port;
        }
        if (!overrides->bind.empty()) {
            config.server.bind_address = overrides->bind;
        }

        auto rules = build_rules(config);
        if (!rules) {
            LOG_FATAL("Invalid validator rules: {}", rules.error().what());
            return 1;
        }
        warn_if_sandbox_missing(config);

        exec::Harness harness(config.sandbox, config.execution);
        service::Pipeline pipeline(*rules, harness);

        boost::asio::io_context ioc;
        server::HttpServer server(ioc, pipeline, config.server,
                                  config.execution.worker_threads);

        if (auto listening = server.listen(); !listening) {
            LOG_FATAL("{}", listening.error().what());
            return 1;
        }

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, &server](auto ec, auto /*sig*/) {
            if (!ec) {
                LOG_INFO("Received shutdown signal");
                server.stop();
                ioc.stop();
            }
        });

        boost::asio::co_spawn(ioc, server.run(), boost::asio::detached);

        LOG_INFO("scriptbox {} serving with {} worker threads, timeout {}s",
                 SCRIPTBOX_VERSION_STRING, config.execution.worker_threads,
                 config.execution.timeout_seconds);
        ioc.run();

        LOG_INFO("scriptbox stopped.");
        Logger::flush();
        return 0;
    };

    return {sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

auto register_check_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("check", "Validate a script without running it");

    auto path = std::make_shared<std::string>();
    sub->add_option("file", *path, "Python script to check")
        ->required()
        ->check(CLI::ExistingFile);

    auto action = [path](Config& config) -> int {
        auto rules = build_rules(config);
        if (!rules) {
            LOG_FATAL("Invalid validator rules: {}", rules.error().what());
            return 1;
        }

        auto script = read_script(*path);
        if (!script) {
            LOG_ERROR("{}", script.error().what());
            return 1;
        }

        if (!validation::has_entry_point(*script)) {
            std::cout << *path << ": " << service::messages::kMissingMain << "\n";
            return 1;
        }

        auto valid = validation::validate(**rules, *script);
        if (!valid) {
            const auto& violation = valid.error();
            auto message = std::holds_alternative<validation::DisallowedImport>(violation)
                ? service::messages::kDangerousImport
                : service::messages::kDangerousOperation;
            std::cout << *path << ": " << message
                      << " (" << validation::describe(violation) << ")\n";
            return 1;
        }

        std::cout << *path << ": OK\n";
        return 0;
    };

    return {sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

auto register_run_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("run", "Execute a script and print the service reply");

    auto path = std::make_shared<std::string>();
    sub->add_option("file", *path, "Python script to execute")
        ->required()
        ->check(CLI::ExistingFile);

    auto action = [path](Config& config) -> int {
        auto rules = build_rules(config);
        if (!rules) {
            LOG_FATAL("Invalid validator rules: {}", rules.error().what());
            return 1;
        }
        warn_if_sandbox_missing(config);

        auto script = read_script(*path);
        if (!script) {
            LOG_ERROR("{}", script.error().what());
            return 1;
        }

        exec::Harness harness(config.sandbox, config.execution);
        service::Pipeline pipeline(*rules, harness);

        auto reply = pipeline.run(*script);
        std::cout << reply.body.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        return reply.status == 200 ? 0 : 1;
    };

    return {sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    auto action = [validate_only](Config& config) -> int {
        // File and environment were already checked while resolving the
        // configuration; the rule patterns are compiled here.
        if (auto rules = build_rules(config); !rules) {
            std::cerr << "Invalid configuration: " << rules.error().what() << "\n";
            return 1;
        }

        if (*validate_only) {
            std::cout << "Configuration is valid.\n";
            return 0;
        }

        json j = config;
        std::cout << j.dump(2) << "\n";
        return 0;
    };

    return {sub, std::move(action)};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");

    auto action = [](Config& /*config*/) -> int {
        std::cout << "scriptbox " << SCRIPTBOX_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif

#if defined(__linux__)
        std::cout << "Platform: Linux\n";
#else
        std::cout << "Platform: other\n";
#endif
        return 0;
    };

    return {sub, std::move(action), false};
}

} // namespace scriptbox::cli
