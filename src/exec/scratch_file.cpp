#include "scriptbox/exec/scratch_file.hpp"

#include "scriptbox/core/logger.hpp"
#include "scriptbox/core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace scriptbox::exec {

namespace fs = std::filesystem;

namespace {

auto write_all(int fd, std::string_view data) -> bool {
    while (!data.empty()) {
        auto n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

} // anonymous namespace

auto ScratchFile::create(const fs::path& dir, std::string_view contents)
    -> Result<ScratchFile> {
    std::error_code ec;
    auto base = dir.empty() ? fs::temp_directory_path(ec) : dir;
    if (ec) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "No temporary directory available", ec.message()));
    }

    auto path = base / ("scriptbox-" + utils::generate_uuid() + ".py");

    // 0644: the sandboxed interpreter may run under a different uid.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed to create scratch file",
            path.string() + ": " + std::strerror(errno)));
    }

    // From here on the handle owns the file, so every failure removes it.
    ScratchFile file(path);

    bool written = write_all(fd, contents);
    int write_errno = errno;
    if (::close(fd) != 0 && written) {
        written = false;
        write_errno = errno;
    }
    if (!written) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed to write scratch file",
            path.string() + ": " + std::strerror(write_errno)));
    }
    // Explicit mode, independent of the process umask.
    if (::chmod(path.c_str(), 0644) != 0) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Failed to set scratch file mode",
            path.string() + ": " + std::strerror(errno)));
    }

    LOG_TRACE("Scratch file created: {} ({} bytes)", path.string(), contents.size());
    return file;
}

ScratchFile::ScratchFile(fs::path path) : path_(std::move(path)) {}

ScratchFile::~ScratchFile() {
    remove();
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void ScratchFile::remove() noexcept {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove scratch file {}: {}", path_.string(), ec.message());
    } else {
        LOG_TRACE("Scratch file removed: {}", path_.string());
    }
    path_.clear();
}

} // namespace scriptbox::exec
