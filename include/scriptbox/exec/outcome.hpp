#pragma once

#include <string>
#include <variant>

namespace scriptbox::exec {

/// The sandbox process ran to completion. A non-zero exit code is not a
/// failure at this layer; a process killed by signal N reports 128 + N.
struct Completed {
    int exit_code = 0;
    std::string stdout_bytes;
};

/// The wall-clock deadline passed and the process group was killed.
struct TimedOut {};

/// The process could not be started at all.
struct LaunchFailed {
    std::string reason;
};

using ExecutionOutcome = std::variant<Completed, TimedOut, LaunchFailed>;

/// Outcome plus the separately captured standard error, which is only
/// surfaced to callers on failure and never parsed.
struct ExecutionReport {
    ExecutionOutcome outcome;
    std::string stderr_text;
};

} // namespace scriptbox::exec
