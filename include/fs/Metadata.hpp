#pragma once

#include <sys/types.h>
#include <filesystem>

namespace sm::fs {

struct FileMetadata {
    uid_t uid = 0;
    gid_t gid = 0;
    mode_t mode = 0;   // permission bits only (07777)

    bool operator==(const FileMetadata&) const = default;
};

// stat(2) of a regular file, following symlinks. Throws IOError.
FileMetadata readMetadata(const std::filesystem::path& path);

// fchown + fchmod on an open descriptor. Throws IOError.
void applyMetadata(int fd, const FileMetadata& meta, const std::filesystem::path& label);

}
