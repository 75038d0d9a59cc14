#include "scriptbox/core/config.hpp"
#include "scriptbox/core/logger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace scriptbox {

namespace {

template <typename T>
auto parse_number(std::string_view name, std::string_view text) -> Result<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "Invalid numeric value for " + std::string(name),
            std::string(text)));
    }
    return value;
}

} // anonymous namespace

auto parse_config(std::string_view text) -> Result<Config> {
    try {
        auto j = json::parse(text);
        if (j.is_null()) {
            return default_config();
        }
        if (!j.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Configuration root must be a JSON object"));
        }
        auto config = j.get<Config>();
        if (auto valid = validate_config(config); !valid) {
            return std::unexpected(valid.error());
        }
        return config;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Failed to parse configuration", e.what()));
    }
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open config file", path.string()));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    auto config = parse_config(contents.str());
    if (!config) {
        LOG_ERROR("Config {}: {}", path.string(), config.error().what());
    }
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto apply_env_overrides(Config& config) -> VoidResult {
    if (auto* val = std::getenv("SCRIPTBOX_PORT")) {
        auto port = parse_number<unsigned>("SCRIPTBOX_PORT", val);
        if (!port) return std::unexpected(port.error());
        if (*port == 0 || *port > std::numeric_limits<uint16_t>::max()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "SCRIPTBOX_PORT out of range", val));
        }
        config.server.port = static_cast<uint16_t>(*port);
    }
    if (auto* val = std::getenv("SCRIPTBOX_BIND")) {
        config.server.bind_address = val;
    }
    if (auto* val = std::getenv("SCRIPTBOX_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("SCRIPTBOX_TIMEOUT")) {
        auto seconds = parse_number<int>("SCRIPTBOX_TIMEOUT", val);
        if (!seconds) return std::unexpected(seconds.error());
        config.execution.timeout_seconds = *seconds;
    }
    if (auto* val = std::getenv("SCRIPTBOX_SANDBOX")) {
        config.sandbox.executable = val;
    }
    if (auto* val = std::getenv("SCRIPTBOX_INTERPRETER")) {
        config.sandbox.interpreter = val;
    }
    return validate_config(config);
}

auto validate_config(const Config& config) -> VoidResult {
    if (config.execution.timeout_seconds <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "execution.timeout_seconds must be positive",
            std::to_string(config.execution.timeout_seconds)));
    }
    if (config.execution.worker_threads == 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "execution.worker_threads must be at least 1"));
    }
    if (config.execution.max_output_bytes == 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "execution.max_output_bytes must be positive"));
    }
    if (config.sandbox.interpreter.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "sandbox.interpreter must not be empty"));
    }
    if (config.server.max_body_bytes == 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "server.max_body_bytes must be positive"));
    }
    return {};
}

} // namespace scriptbox
