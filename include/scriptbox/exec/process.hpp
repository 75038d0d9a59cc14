#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "scriptbox/exec/outcome.hpp"

namespace scriptbox::exec {

/// Starts `argv` as a child process in a new session, captures its stdout
/// and stderr, and enforces a hard wall-clock `timeout`. When the deadline
/// passes the whole process group receives SIGKILL and TimedOut is
/// reported. The child is always reaped before returning.
///
/// At most `max_output_bytes` are kept per stream; further output is read
/// and discarded so the child never blocks on a full pipe.
auto run_process(const std::vector<std::string>& argv,
                 std::chrono::milliseconds timeout,
                 std::size_t max_output_bytes) -> ExecutionReport;

/// Resolves a program name against PATH the way execvp would. Names that
/// contain a slash are returned unchanged. Returns an empty string when no
/// executable file is found.
auto resolve_executable(std::string_view name) -> std::string;

} // namespace scriptbox::exec
