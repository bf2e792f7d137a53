#include "fs/Metadata.hpp"
#include "types/Error.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>

namespace sm::fs {

FileMetadata readMetadata(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        throw IOError(fmt::format("failed to read metadata of '{}': {}", path.string(), std::strerror(errno)));
    if (!S_ISREG(st.st_mode))
        throw IOError(fmt::format("'{}' is not a regular file", path.string()));
    return {st.st_uid, st.st_gid, static_cast<mode_t>(st.st_mode & 07777)};
}

void applyMetadata(const int fd, const FileMetadata& meta, const std::filesystem::path& label) {
    // ownership first: chown may clear setuid/setgid bits that fchmod then restores
    if (::fchown(fd, meta.uid, meta.gid) != 0)
        throw IOError(fmt::format("failed to assign ownership to '{}': {}", label.string(), std::strerror(errno)));
    if (::fchmod(fd, meta.mode) != 0)
        throw IOError(fmt::format("failed to assign permissions to '{}': {}", label.string(), std::strerror(errno)));
}

}
