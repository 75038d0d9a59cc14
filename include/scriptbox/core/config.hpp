#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "scriptbox/core/error.hpp"
#include "scriptbox/core/types.hpp"

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// accept optional fields (absent or null maps to std::nullopt).
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace scriptbox {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8080;
    size_t max_body_bytes = 1024 * 1024;
    size_t max_connections = 256;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, bind_address, port, max_body_bytes, max_connections)

struct ExecutionConfig {
    int timeout_seconds = 5;
    std::string scratch_dir;  // empty = system temp directory
    size_t max_output_bytes = 8 * 1024 * 1024;
    size_t worker_threads = 4;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExecutionConfig, timeout_seconds, scratch_dir, max_output_bytes, worker_threads)

/// How the external sandbox is invoked. One run executes
/// `executable args... interpreter <scratch path>`; with an empty
/// executable the interpreter is started directly, without isolation.
struct SandboxConfig {
    std::string executable = "nsjail";
    std::vector<std::string> args = {"--config", "./config.proto", "--"};
    std::string interpreter = "/usr/local/bin/python3";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SandboxConfig, executable, args, interpreter)

struct PatternRule {
    std::string pattern;
    std::string description;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PatternRule, pattern, description)

/// Overrides for the validator rule set. A present list replaces the
/// built-in list of the same kind.
struct RulesConfig {
    std::optional<std::vector<std::string>> allowed_modules;
    std::optional<std::vector<std::string>> dangerous_names;
    std::optional<std::vector<PatternRule>> dangerous_patterns;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RulesConfig, allowed_modules, dangerous_names, dangerous_patterns)

struct Config {
    ServerConfig server;
    ExecutionConfig execution;
    SandboxConfig sandbox;
    RulesConfig rules;
    std::string log_level = "info";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, server, execution, sandbox, rules, log_level)

/// Loads a JSON configuration file. A missing file yields the defaults;
/// unparseable or out-of-range content is an InvalidConfig error.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Parses configuration from a JSON document held in memory.
auto parse_config(std::string_view text) -> Result<Config>;

auto default_config() -> Config;

/// Applies SCRIPTBOX_* environment variables on top of `config`.
auto apply_env_overrides(Config& config) -> VoidResult;

/// Range checks that the JSON schema alone cannot express.
auto validate_config(const Config& config) -> VoidResult;

} // namespace scriptbox
