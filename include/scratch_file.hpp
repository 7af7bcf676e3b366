#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <expected>

namespace leakscan {

struct ScratchFileError {
    std::string message;
    int code;
};

// Uniquely named temporary file holding a copy of some content. The file is
// removed when the object is destroyed, whichever way the caller leaves.
class ScratchFile {
public:
    static std::expected<ScratchFile, ScratchFileError> create(
        std::string_view content,
        const std::filesystem::path& dir = {}
    );

    ~ScratchFile();

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    ScratchFile(ScratchFile&&) noexcept;
    ScratchFile& operator=(ScratchFile&&) noexcept;

    const std::filesystem::path& path() const { return path_; }

private:
    explicit ScratchFile(std::filesystem::path path) : path_(std::move(path)) {}

    void remove();

    std::filesystem::path path_;
};

} // namespace leakscan
