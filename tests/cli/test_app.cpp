#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <vector>

#include "scriptbox/cli/app.hpp"
#include "scriptbox/core/utils.hpp"
#include "scriptbox/exec/wrapper.hpp"

using namespace scriptbox;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path = fs::temp_directory_path() / ("scriptbox-test-" + utils::generate_id(12));
    TempDir() { fs::create_directories(path); }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    auto write(const std::string& name, const std::string& contents) const -> std::string {
        auto file = path / name;
        std::ofstream out(file);
        out << contents;
        return file.string();
    }
};

auto run_cli(std::vector<std::string> args) -> int {
    args.insert(args.begin(), "scriptbox");
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    cli::App app;
    return app.run(static_cast<int>(args.size()), argv.data());
}

/// Configuration whose sandbox is a shell script printing a fixed result.
auto fake_sandbox_config(const TempDir& dir, const std::string& result_line) -> std::string {
    json config = {
        {"execution", {{"scratch_dir", dir.path.string()}}},
        {"sandbox", {
            {"executable", "/bin/sh"},
            {"args", json::array({"-c",
                                  "printf '%s\\n' '" + std::string(exec::kSentinel) + "' '" +
                                      result_line + "'",
                                  "sandbox"})},
            {"interpreter", "python3"},
        }},
    };
    return dir.write("scriptbox.json", config.dump());
}

} // anonymous namespace

TEST_CASE("version subcommand", "[cli][app]") {
    CHECK(run_cli({"version"}) == 0);
}

TEST_CASE("A subcommand is required", "[cli][app]") {
    CHECK(run_cli({}) != 0);
}

TEST_CASE("check accepts a clean script", "[cli][app]") {
    TempDir dir;
    auto script = dir.write("ok.py", "import math\ndef main():\n    return {'v': math.pi}\n");
    CHECK(run_cli({"check", script}) == 0);
}

TEST_CASE("check rejects unsafe or incomplete scripts", "[cli][app]") {
    TempDir dir;
    CHECK(run_cli({"check", dir.write("a.py", "import socket\ndef main():\n    return {}\n")}) == 1);
    CHECK(run_cli({"check", dir.write("b.py", "def main():\n    return eval('1')\n")}) == 1);
    CHECK(run_cli({"check", dir.write("c.py", "print('no entry point')\n")}) == 1);
}

TEST_CASE("check requires an existing file", "[cli][app]") {
    CHECK(run_cli({"check", "/nonexistent/script.py"}) != 0);
}

TEST_CASE("run executes through the configured sandbox", "[cli][app]") {
    TempDir dir;
    auto config = fake_sandbox_config(dir, "{\"ok\": true}");
    auto script = dir.write("job.py", "def main():\n    return {'ok': True}\n");

    CHECK(run_cli({"-c", config, "run", script}) == 0);
}

TEST_CASE("run exits non-zero on a failed reply", "[cli][app]") {
    TempDir dir;
    auto config = fake_sandbox_config(dir, "[1, 2]");
    auto script = dir.write("job.py", "def main():\n    return [1, 2]\n");

    CHECK(run_cli({"-c", config, "run", script}) == 1);
}

TEST_CASE("config --validate", "[cli][app]") {
    TempDir dir;

    SECTION("valid file") {
        auto config = dir.write("good.json", R"({"server": {"port": 9000}})");
        CHECK(run_cli({"-c", config, "config", "--validate"}) == 0);
    }

    SECTION("malformed file") {
        auto config = dir.write("bad.json", "{ nope");
        CHECK(run_cli({"-c", config, "config", "--validate"}) == 1);
    }

    SECTION("rule pattern that does not compile") {
        auto config = dir.write("rules.json",
                                R"({"rules": {"dangerous_patterns": [{"pattern": "(", "description": "x"}]}})");
        CHECK(run_cli({"-c", config, "config", "--validate"}) == 1);
    }
}
