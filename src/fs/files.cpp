#include "fs/files.hpp"
#include "types/Error.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <fmt/core.h>

namespace sm::fs {

namespace {

std::string errnoText() { return std::strerror(errno); }

}

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw IOError("failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw IOError("failed to read file: " + path.string());

    return buffer;
}

std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw IOError("failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw IOError("failed to read file: " + path.string());

    return buffer;
}

TempFile::TempFile(std::filesystem::path target) : target_(std::move(target)) {
    auto pattern = (target_.parent_path() / ("." + target_.filename().string() + ".XXXXXX")).string();
    fd_ = ::mkstemp(pattern.data());
    if (fd_ < 0)
        throw IOError(fmt::format("failed to create temporary file beside '{}': {}", target_.string(), errnoText()));
    tmp_ = pattern;
}

TempFile::~TempFile() {
    closeFd();
    if (!committed_ && !tmp_.empty()) ::unlink(tmp_.c_str());
}

void TempFile::closeFd() noexcept {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

void TempFile::write(const std::vector<uint8_t>& data) {
    const auto* p = data.data();
    size_t left = data.size();
    while (left) {
        const ssize_t n = ::write(fd_, p, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) throw IOError(fmt::format("failed to write to '{}': {}", target_.string(), errnoText()));
        p += n;
        left -= static_cast<size_t>(n);
    }
    if (::fsync(fd_) != 0) throw IOError(fmt::format("failed to flush '{}': {}", target_.string(), errnoText()));
}

void TempFile::applyMetadata(const FileMetadata& meta) {
    fs::applyMetadata(fd_, meta, target_);
}

void TempFile::chmod(const mode_t mode) {
    if (::fchmod(fd_, mode) != 0)
        throw IOError(fmt::format("failed to assign permissions to '{}': {}", target_.string(), errnoText()));
}

std::vector<uint8_t> TempFile::readBack() const {
    return readFileToVector(tmp_);
}

void TempFile::commit() {
    closeFd();
    if (::rename(tmp_.c_str(), target_.c_str()) != 0)
        throw IOError(fmt::format("failed to move '{}' into place: {}", target_.string(), errnoText()));
    committed_ = true;
}

void writeFileAtomic(const std::filesystem::path& path, const std::vector<uint8_t>& data, const mode_t mode) {
    TempFile tmp(path);
    tmp.write(data);
    tmp.chmod(mode);
    tmp.commit();
}

void ensureDirectories(const std::filesystem::path& path, const mode_t mode, const FileMetadata* owner) {
    if (path.empty()) return;

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return;

    ensureDirectories(path.parent_path(), mode, owner);

    if (::mkdir(path.c_str(), mode) != 0 && errno != EEXIST)
        throw IOError(fmt::format("failed to create directory '{}': {}", path.string(), errnoText()));

    if (owner && ::chown(path.c_str(), owner->uid, owner->gid) != 0)
        throw IOError(fmt::format("failed to assign ownership to directory '{}': {}", path.string(), errnoText()));
}

bool removeQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return !ec;
}

}
