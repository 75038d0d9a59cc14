#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "scriptbox/core/types.hpp"
#include "scriptbox/exec/harness.hpp"
#include "scriptbox/validation/rule_set.hpp"

namespace scriptbox::service {

/// Why a request did not produce a result.
enum class FailureKind {
    MissingField,
    MissingEntryPoint,
    ValidationRejected,
    Timeout,
    LaunchFailed,
    SerializationFailed,
    ResultTypeInvalid,
    DecodeProtocolViolation,
    InternalError,
};

auto to_string(FailureKind kind) -> std::string_view;

/// Client-visible response of one request.
struct Reply {
    unsigned status = 200;
    json body = json::object();
    std::optional<FailureKind> failure;

    [[nodiscard]] auto ok() const noexcept -> bool { return !failure.has_value(); }
};

namespace messages {
inline constexpr const char* kMissingScript = "Missing 'script' in request";
inline constexpr const char* kMissingMain = "Script must define a main() function";
inline constexpr const char* kDangerousImport = "Potentially dangerous import detected";
inline constexpr const char* kDangerousOperation = "Potentially dangerous operation detected";
inline constexpr const char* kInvalidResult = "Script must return a valid JSON value";
inline constexpr const char* kExecutionFailed = "Script execution failed";
} // namespace messages

/// The per-request state machine:
/// parse -> entry-point check -> validate -> execute -> decode -> reply.
///
/// Every stage is a function of its inputs; the rule set is shared
/// read-only and the harness is stateless, so one Pipeline serves
/// concurrent requests without locking. No stage retries. Untrusted text
/// reaches the filesystem only after validation has passed.
class Pipeline {
public:
    Pipeline(validation::RuleSetPtr rules, const exec::Harness& harness);

    /// Handles a raw `POST /execute` body.
    [[nodiscard]] auto handle(std::string_view request_body) const -> Reply;

    /// Handles an already parsed request document.
    [[nodiscard]] auto handle_json(const json& request) const -> Reply;

    /// Runs one script through validation and execution.
    [[nodiscard]] auto run(std::string_view script) const -> Reply;

private:
    [[nodiscard]] auto reply_for(std::string_view request_id,
                                 exec::ExecutionReport report) const -> Reply;

    validation::RuleSetPtr rules_;
    const exec::Harness& harness_;
};

} // namespace scriptbox::service
