#include "scratch_file.hpp"
#include "compact_log.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <vector>

namespace leakscan {

namespace {

constexpr std::string_view kTag = "ScratchFile";

std::filesystem::path default_dir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path("/tmp") : dir;
}

} // namespace

std::expected<ScratchFile, ScratchFileError> ScratchFile::create(
    std::string_view content,
    const std::filesystem::path& dir)
{
    auto base = dir.empty() ? default_dir() : dir;
    std::string tmpl = (base / "leakscan-scan-XXXXXX").string();
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return std::unexpected(ScratchFileError{"mkstemp in " + base.string() + ": " + std::strerror(errno), errno});
    }

    // Owns the path from here on, so every early return below unlinks it
    ScratchFile file{std::filesystem::path(name.data())};

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int code = errno;
            ::close(fd);
            return std::unexpected(ScratchFileError{"write " + file.path_.string() + ": " + std::strerror(code), code});
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        int code = errno;
        return std::unexpected(ScratchFileError{"close " + file.path_.string() + ": " + std::strerror(code), code});
    }
    return file;
}

ScratchFile::~ScratchFile() {
    remove();
}

ScratchFile::ScratchFile(ScratchFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchFile& ScratchFile::operator=(ScratchFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScratchFile::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) compact::Log::warn(kTag, "failed to remove " + path_.string() + ": " + ec.message());
    path_.clear();
}

} // namespace leakscan
