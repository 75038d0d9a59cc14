#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "scriptbox/core/config.hpp"
#include "scriptbox/exec/outcome.hpp"

namespace scriptbox::exec {

/// Runs validated scripts inside the external sandbox.
///
/// Each execute() call is independent: it wraps the source, writes it to
/// its own scratch file, runs the sandbox with a hard deadline and removes
/// the scratch file before returning. The harness holds no mutable state,
/// so one instance serves any number of concurrent callers.
class Harness {
public:
    Harness(SandboxConfig sandbox, ExecutionConfig execution);

    /// Source must already have passed validation.
    [[nodiscard]] auto execute(std::string_view validated_source,
                               std::chrono::milliseconds timeout) const -> ExecutionReport;

    /// Same, with the configured timeout.
    [[nodiscard]] auto execute(std::string_view validated_source) const -> ExecutionReport;

    /// The command line that runs `script_path` in the sandbox.
    [[nodiscard]] auto command_for(const std::filesystem::path& script_path) const
        -> std::vector<std::string>;

    [[nodiscard]] auto default_timeout() const noexcept -> std::chrono::milliseconds {
        return default_timeout_;
    }

private:
    SandboxConfig sandbox_;
    std::filesystem::path scratch_dir_;
    std::size_t max_output_bytes_;
    std::chrono::milliseconds default_timeout_;
};

} // namespace scriptbox::exec
