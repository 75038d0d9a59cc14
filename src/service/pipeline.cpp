#include "scriptbox/service/pipeline.hpp"

#include "scriptbox/core/logger.hpp"
#include "scriptbox/core/utils.hpp"
#include "scriptbox/exec/decoder.hpp"
#include "scriptbox/validation/validator.hpp"

#include <chrono>

namespace scriptbox::service {

namespace {

auto failure(unsigned status, FailureKind kind, json body) -> Reply {
    return Reply{status, std::move(body), kind};
}

auto error_body(std::string_view message) -> json {
    return json{{"error", std::string(message)}};
}

/// Diagnostic for a generic execution failure: the sandbox's stderr when it
/// said anything, otherwise our own description.
auto diagnostic(const std::string& stderr_text, std::string_view fallback) -> std::string {
    auto trimmed = utils::trim(stderr_text);
    if (!trimmed.empty()) return trimmed;
    return std::string(fallback);
}

} // anonymous namespace

auto to_string(FailureKind kind) -> std::string_view {
    switch (kind) {
        case FailureKind::MissingField: return "missing_field";
        case FailureKind::MissingEntryPoint: return "missing_entry_point";
        case FailureKind::ValidationRejected: return "validation_rejected";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::LaunchFailed: return "launch_failed";
        case FailureKind::SerializationFailed: return "serialization_failed";
        case FailureKind::ResultTypeInvalid: return "result_type_invalid";
        case FailureKind::DecodeProtocolViolation: return "decode_protocol_violation";
        case FailureKind::InternalError: return "internal_error";
    }
    return "unknown";
}

Pipeline::Pipeline(validation::RuleSetPtr rules, const exec::Harness& harness)
    : rules_(std::move(rules)), harness_(harness) {}

auto Pipeline::handle(std::string_view request_body) const -> Reply {
    auto request = json::parse(request_body, nullptr, /*allow_exceptions=*/false);
    if (request.is_discarded()) {
        LOG_DEBUG("Pipeline: request body is not JSON ({} bytes)", request_body.size());
        return failure(400, FailureKind::MissingField, error_body(messages::kMissingScript));
    }
    return handle_json(request);
}

auto Pipeline::handle_json(const json& request) const -> Reply {
    if (!request.is_object() || !request.contains("script") ||
        !request.at("script").is_string()) {
        return failure(400, FailureKind::MissingField, error_body(messages::kMissingScript));
    }
    return run(request.at("script").get_ref<const std::string&>());
}

auto Pipeline::run(std::string_view script) const -> Reply {
    auto request_id = utils::generate_id(8);
    LOG_DEBUG("[{}] Script received ({} bytes)", request_id, script.size());
    LOG_TRACE("[{}] Script source:\n{}", request_id, script);

    if (!validation::has_entry_point(script)) {
        LOG_INFO("[{}] Rejected: no main() definition", request_id);
        return failure(400, FailureKind::MissingEntryPoint, error_body(messages::kMissingMain));
    }

    if (auto valid = validation::validate(*rules_, script); !valid) {
        const auto& violation = valid.error();
        LOG_INFO("[{}] Rejected: {}", request_id, validation::describe(violation));
        auto message = std::holds_alternative<validation::DisallowedImport>(violation)
            ? messages::kDangerousImport
            : messages::kDangerousOperation;
        return failure(400, FailureKind::ValidationRejected, error_body(message));
    }

    auto started = Clock::now();
    auto report = harness_.execute(script);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started);
    LOG_DEBUG("[{}] Sandbox finished in {}ms", request_id, elapsed.count());

    return reply_for(request_id, std::move(report));
}

auto Pipeline::reply_for(std::string_view request_id,
                         exec::ExecutionReport report) const -> Reply {
    if (std::holds_alternative<exec::TimedOut>(report.outcome)) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            harness_.default_timeout()).count();
        LOG_WARN("[{}] Timed out after {}s", request_id, seconds);
        return failure(400, FailureKind::Timeout, json{
            {"error", "Script execution timed out after " + std::to_string(seconds) + " seconds"},
            {"stdout", ""},
        });
    }

    if (auto* launch = std::get_if<exec::LaunchFailed>(&report.outcome)) {
        LOG_WARN("[{}] Sandbox launch failed: {}", request_id, launch->reason);
        return failure(400, FailureKind::LaunchFailed, json{
            {"error", messages::kExecutionFailed},
            {"stderr", diagnostic(report.stderr_text, launch->reason)},
        });
    }

    auto& completed = std::get<exec::Completed>(report.outcome);
    auto decoded = exec::decode(completed.stdout_bytes);

    if (auto* ok = std::get_if<exec::DecodeSuccess>(&decoded)) {
        LOG_INFO("[{}] Completed (exit code {})", request_id, completed.exit_code);
        return Reply{200, json{
            {"result", std::move(ok->value)},
            {"stdout", std::move(ok->stdout_text)},
        }, std::nullopt};
    }

    auto& bad = std::get<exec::DecodeFailure>(decoded);
    LOG_INFO("[{}] Decode failed ({}, exit code {}): {}", request_id,
             exec::to_string(bad.kind), completed.exit_code, bad.detail);

    if (bad.kind == exec::DecodeFailureKind::ResultTypeOrSerializationError) {
        auto kind = bad.guest_reported ? FailureKind::SerializationFailed
                                       : FailureKind::ResultTypeInvalid;
        return failure(400, kind, json{
            {"error", messages::kInvalidResult},
            {"stdout", std::move(bad.stdout_text)},
        });
    }

    return failure(400, FailureKind::DecodeProtocolViolation, json{
        {"error", messages::kExecutionFailed},
        {"stderr", diagnostic(report.stderr_text, bad.detail)},
    });
}

} // namespace scriptbox::service
