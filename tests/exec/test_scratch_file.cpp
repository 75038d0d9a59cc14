#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

#include "scriptbox/core/utils.hpp"
#include "scriptbox/exec/scratch_file.hpp"

using namespace scriptbox;
using namespace scriptbox::exec;
namespace fs = std::filesystem;

namespace {

/// Private directory removed with everything in it.
struct TempDir {
    fs::path path = fs::temp_directory_path() / ("scriptbox-test-" + utils::generate_id(12));
    TempDir() { fs::create_directories(path); }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    [[nodiscard]] auto entries() const -> std::size_t {
        return static_cast<std::size_t>(
            std::distance(fs::directory_iterator(path), fs::directory_iterator{}));
    }
};

auto read_file(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

} // anonymous namespace

TEST_CASE("Scratch file holds the payload", "[exec][scratch_file]") {
    TempDir dir;
    auto file = ScratchFile::create(dir.path, "print('hi')\n");
    REQUIRE(file.has_value());

    CHECK(file->path().parent_path() == dir.path);
    CHECK(file->path().filename().string().starts_with("scriptbox-"));
    CHECK(file->path().extension() == ".py");
    CHECK(read_file(file->path()) == "print('hi')\n");
}

TEST_CASE("Scratch file is world readable", "[exec][scratch_file]") {
    TempDir dir;
    auto file = ScratchFile::create(dir.path, "x = 1\n");
    REQUIRE(file.has_value());

    struct stat st{};
    REQUIRE(::stat(file->path().c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0644);
}

TEST_CASE("Scratch file is removed when the handle goes away", "[exec][scratch_file]") {
    TempDir dir;
    fs::path path;
    {
        auto file = ScratchFile::create(dir.path, "x = 1\n");
        REQUIRE(file.has_value());
        path = file->path();
        CHECK(fs::exists(path));
    }
    CHECK_FALSE(fs::exists(path));
    CHECK(dir.entries() == 0);
}

TEST_CASE("Moving a scratch file transfers ownership", "[exec][scratch_file]") {
    TempDir dir;
    auto first = ScratchFile::create(dir.path, "a\n");
    REQUIRE(first.has_value());
    auto path = first->path();

    {
        ScratchFile moved = std::move(*first);
        CHECK(moved.path() == path);
        CHECK(first->path().empty());
        CHECK(fs::exists(path));
    }
    CHECK_FALSE(fs::exists(path));

    SECTION("move assignment removes the overwritten file") {
        auto a = ScratchFile::create(dir.path, "a\n");
        auto b = ScratchFile::create(dir.path, "b\n");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        auto a_path = a->path();
        auto b_path = b->path();

        *a = std::move(*b);
        CHECK_FALSE(fs::exists(a_path));
        CHECK(fs::exists(b_path));
        CHECK(a->path() == b_path);
    }
}

TEST_CASE("Concurrent scratch files get distinct names", "[exec][scratch_file]") {
    TempDir dir;
    std::vector<ScratchFile> files;
    for (int i = 0; i < 50; ++i) {
        auto file = ScratchFile::create(dir.path, "pass\n");
        REQUIRE(file.has_value());
        files.push_back(std::move(*file));
    }
    CHECK(dir.entries() == 50);
    files.clear();
    CHECK(dir.entries() == 0);
}

TEST_CASE("Missing directory is an I/O error", "[exec][scratch_file]") {
    auto file = ScratchFile::create("/nonexistent/scriptbox/dir", "x = 1\n");
    REQUIRE_FALSE(file.has_value());
    CHECK(file.error().code() == ErrorCode::IoError);
}

TEST_CASE("Empty directory means the system temp directory", "[exec][scratch_file]") {
    auto file = ScratchFile::create({}, "x = 1\n");
    REQUIRE(file.has_value());
    CHECK(file->path().parent_path() == fs::temp_directory_path());
}
