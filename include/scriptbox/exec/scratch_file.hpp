#pragma once

#include <filesystem>
#include <string_view>

#include "scriptbox/core/error.hpp"

namespace scriptbox::exec {

/// A uniquely named transient file holding one payload. Move-only; the
/// file is removed when the owning handle is destroyed, on every exit path.
class ScratchFile {
public:
    /// Writes `contents` to a fresh `scriptbox-<uuid>.py` inside `dir`
    /// (the system temp directory when `dir` is empty). The name is
    /// reserved with O_EXCL, so concurrent calls never share a file.
    [[nodiscard]] static auto create(const std::filesystem::path& dir,
                                     std::string_view contents) -> Result<ScratchFile>;

    ~ScratchFile();

    ScratchFile(ScratchFile&& other) noexcept;
    ScratchFile& operator=(ScratchFile&& other) noexcept;

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }

private:
    explicit ScratchFile(std::filesystem::path path);

    void remove() noexcept;

    std::filesystem::path path_;
};

} // namespace scriptbox::exec
