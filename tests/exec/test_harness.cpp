#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <future>
#include <vector>

#include "scriptbox/core/utils.hpp"
#include "scriptbox/exec/decoder.hpp"
#include "scriptbox/exec/harness.hpp"
#include "scriptbox/exec/process.hpp"
#include "scriptbox/exec/wrapper.hpp"

using namespace scriptbox;
using namespace scriptbox::exec;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path = fs::temp_directory_path() / ("scriptbox-test-" + utils::generate_id(12));
    TempDir() { fs::create_directories(path); }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    [[nodiscard]] auto empty() const -> bool { return fs::is_empty(path); }
};

/// A stand-in sandbox: `/bin/sh -c <script> sandbox <interpreter> <file>`,
/// so inside the script $1 is the interpreter and $2 the scratch file.
auto fake_sandbox(const std::string& script) -> SandboxConfig {
    SandboxConfig sandbox;
    sandbox.executable = "/bin/sh";
    sandbox.args = {"-c", script, "sandbox"};
    sandbox.interpreter = "python3";
    return sandbox;
}

auto execution_in(const TempDir& dir) -> ExecutionConfig {
    ExecutionConfig execution;
    execution.scratch_dir = dir.path.string();
    execution.timeout_seconds = 5;
    return execution;
}

auto stdout_of(const ExecutionReport& report) -> std::string {
    const auto* done = std::get_if<Completed>(&report.outcome);
    return done ? done->stdout_bytes : std::string{};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------

TEST_CASE("Sandbox command line", "[exec][harness]") {
    SandboxConfig sandbox;
    sandbox.executable = "nsjail";
    sandbox.args = {"--config", "./config.proto", "--"};
    sandbox.interpreter = "/usr/local/bin/python3";

    Harness harness(sandbox, ExecutionConfig{});
    auto argv = harness.command_for("/tmp/scriptbox-x.py");

    CHECK(argv == std::vector<std::string>{
        "nsjail", "--config", "./config.proto", "--",
        "/usr/local/bin/python3", "/tmp/scriptbox-x.py"});
}

TEST_CASE("Without a sandbox the interpreter runs directly", "[exec][harness]") {
    SandboxConfig sandbox;
    sandbox.executable = "";
    sandbox.interpreter = "python3";

    Harness harness(sandbox, ExecutionConfig{});
    CHECK(harness.command_for("/tmp/a.py") == std::vector<std::string>{"python3", "/tmp/a.py"});
}

TEST_CASE("Default timeout comes from the configuration", "[exec][harness]") {
    ExecutionConfig execution;
    execution.timeout_seconds = 7;
    Harness harness(SandboxConfig{}, execution);
    CHECK(harness.default_timeout() == 7000ms);
}

// ---------------------------------------------------------------------------
// Scratch handling
// ---------------------------------------------------------------------------

TEST_CASE("Sandbox receives the wrapped payload", "[exec][harness]") {
    TempDir dir;
    Harness harness(fake_sandbox(R"(cat "$2")"), execution_in(dir));

    std::string source = "def main():\n    return {\"a\": 1}\n";
    auto report = harness.execute(source);

    CHECK(stdout_of(report) == wrap_script(source));
}

TEST_CASE("Scratch file is gone once execute returns", "[exec][harness]") {
    TempDir dir;
    Harness harness(fake_sandbox(R"(printf '%s' "$2")"), execution_in(dir));

    auto report = harness.execute("def main():\n    return {}\n");
    auto path = fs::path(stdout_of(report));

    CHECK(path.parent_path() == dir.path);
    CHECK_FALSE(fs::exists(path));
    CHECK(dir.empty());
}

TEST_CASE("Scratch file is removed after a timeout", "[exec][harness]") {
    TempDir dir;
    Harness harness(fake_sandbox("sleep 30"), execution_in(dir));

    auto report = harness.execute("def main():\n    return {}\n", 200ms);

    CHECK(std::holds_alternative<TimedOut>(report.outcome));
    CHECK(dir.empty());
}

TEST_CASE("Missing sandbox executable is a launch failure", "[exec][harness]") {
    TempDir dir;
    SandboxConfig sandbox;
    sandbox.executable = "/nonexistent/nsjail";

    Harness harness(sandbox, execution_in(dir));
    auto report = harness.execute("def main():\n    return {}\n");

    CHECK(std::holds_alternative<LaunchFailed>(report.outcome));
    CHECK(dir.empty());
}

TEST_CASE("Unusable scratch directory is a launch failure", "[exec][harness]") {
    ExecutionConfig execution;
    execution.scratch_dir = "/nonexistent/scriptbox/scratch";

    Harness harness(fake_sandbox("true"), execution);
    auto report = harness.execute("def main():\n    return {}\n");

    auto* failed = std::get_if<LaunchFailed>(&report.outcome);
    REQUIRE(failed != nullptr);
    CHECK(failed->reason.find("scratch") != std::string::npos);
}

TEST_CASE("Concurrent executions are isolated", "[exec][harness]") {
    TempDir dir;
    const Harness harness(fake_sandbox(R"(cat "$2")"), execution_in(dir));

    std::vector<std::future<std::pair<std::string, std::string>>> runs;
    for (int i = 0; i < 8; ++i) {
        runs.push_back(std::async(std::launch::async, [&harness, i] {
            auto source = "def main():\n    return {\"n\": " + std::to_string(i) + "}\n";
            return std::make_pair(wrap_script(source), stdout_of(harness.execute(source)));
        }));
    }

    for (auto& run : runs) {
        auto [expected, actual] = run.get();
        CHECK(actual == expected);
    }
    CHECK(dir.empty());
}

// ---------------------------------------------------------------------------
// Real interpreter
// ---------------------------------------------------------------------------

TEST_CASE("Python scripts run end to end", "[exec][harness][python]") {
    auto python = resolve_executable("python3");
    if (python.empty()) {
        WARN("python3 not found; skipping interpreter tests");
        return;
    }

    TempDir dir;
    SandboxConfig sandbox;
    sandbox.executable = "";
    sandbox.interpreter = python;
    Harness harness(sandbox, execution_in(dir));

    SECTION("result and output are recovered") {
        auto report = harness.execute(
            "import math\n"
            "def main():\n"
            "    print('hello')\n"
            "    return {'root': math.sqrt(16), 'items': [1, 2]}\n");
        auto decoded = decode(stdout_of(report));

        auto* ok = std::get_if<DecodeSuccess>(&decoded);
        REQUIRE(ok != nullptr);
        CHECK(ok->stdout_text == "hello\n");
        CHECK(ok->value["root"] == 4.0);
        CHECK(ok->value["items"] == json::array({1, 2}));
    }

    SECTION("non-string mapping keys come back as strings") {
        auto report = harness.execute("def main():\n    return {1: 'a', 'n': None}\n");
        auto decoded = decode(stdout_of(report));

        auto* ok = std::get_if<DecodeSuccess>(&decoded);
        REQUIRE(ok != nullptr);
        CHECK(ok->value == json{{"1", "a"}, {"n", nullptr}});
    }

    SECTION("unserializable result is reported by the epilogue") {
        auto report = harness.execute("def main():\n    return {'s': {1, 2}}\n");
        auto decoded = decode(stdout_of(report));

        auto* bad = std::get_if<DecodeFailure>(&decoded);
        REQUIRE(bad != nullptr);
        CHECK(bad->kind == DecodeFailureKind::ResultTypeOrSerializationError);
        CHECK(bad->guest_reported);
        CHECK(bad->detail.starts_with("Error serializing result:"));
    }

    SECTION("an exception never reaches the sentinel") {
        auto report = harness.execute("def main():\n    raise ValueError('boom')\n");

        auto* done = std::get_if<Completed>(&report.outcome);
        REQUIRE(done != nullptr);
        CHECK(done->exit_code != 0);
        CHECK(report.stderr_text.find("ValueError: boom") != std::string::npos);

        auto decoded = decode(done->stdout_bytes);
        auto* bad = std::get_if<DecodeFailure>(&decoded);
        REQUIRE(bad != nullptr);
        CHECK(bad->kind == DecodeFailureKind::LaunchOrRuntimeError);
    }

    SECTION("an infinite loop is killed") {
        auto report = harness.execute("def main():\n    while True:\n        pass\n", 500ms);
        CHECK(std::holds_alternative<TimedOut>(report.outcome));
    }

    CHECK(dir.empty());
}
