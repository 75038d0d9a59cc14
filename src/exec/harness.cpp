#include "scriptbox/exec/harness.hpp"

#include "scriptbox/core/logger.hpp"
#include "scriptbox/exec/process.hpp"
#include "scriptbox/exec/scratch_file.hpp"
#include "scriptbox/exec/wrapper.hpp"

namespace scriptbox::exec {

Harness::Harness(SandboxConfig sandbox, ExecutionConfig execution)
    : sandbox_(std::move(sandbox))
    , scratch_dir_(execution.scratch_dir)
    , max_output_bytes_(execution.max_output_bytes)
    , default_timeout_(std::chrono::seconds(execution.timeout_seconds)) {
    if (sandbox_.executable.empty()) {
        LOG_WARN("No sandbox executable configured: scripts run directly under {}",
                 sandbox_.interpreter);
    }
}

auto Harness::command_for(const std::filesystem::path& script_path) const
    -> std::vector<std::string> {
    std::vector<std::string> argv;
    argv.reserve(sandbox_.args.size() + 3);
    if (!sandbox_.executable.empty()) {
        argv.push_back(sandbox_.executable);
        argv.insert(argv.end(), sandbox_.args.begin(), sandbox_.args.end());
    }
    argv.push_back(sandbox_.interpreter);
    argv.push_back(script_path.string());
    return argv;
}

auto Harness::execute(std::string_view validated_source) const -> ExecutionReport {
    return execute(validated_source, default_timeout_);
}

auto Harness::execute(std::string_view validated_source,
                      std::chrono::milliseconds timeout) const -> ExecutionReport {
    auto payload = wrap_script(validated_source);

    // The scratch file lives exactly as long as this scope.
    auto scratch = ScratchFile::create(scratch_dir_, payload);
    if (!scratch) {
        LOG_ERROR("Harness: {}", scratch.error().what());
        return {LaunchFailed{scratch.error().what()}, {}};
    }

    auto report = run_process(command_for(scratch->path()), timeout, max_output_bytes_);

    if (const auto* failed = std::get_if<LaunchFailed>(&report.outcome)) {
        LOG_WARN("Harness: sandbox launch failed: {}", failed->reason);
    } else if (std::holds_alternative<TimedOut>(report.outcome)) {
        LOG_WARN("Harness: script timed out after {}ms", timeout.count());
    }
    return report;
}

} // namespace scriptbox::exec
