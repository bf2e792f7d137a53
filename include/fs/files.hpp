#pragma once

#include "fs/Metadata.hpp"

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sm::fs {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

std::string readFileToString(const std::filesystem::path& path);

// Sibling temp file that is unlinked on destruction unless committed.
class TempFile {
public:
    // mkstemp("<dir>/.<name>.XXXXXX") next to target. Throws IOError.
    explicit TempFile(std::filesystem::path target);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // Writes everything and fsyncs. Throws IOError.
    void write(const std::vector<uint8_t>& data);

    void applyMetadata(const FileMetadata& meta);
    void chmod(mode_t mode);

    // Re-reads what landed on disk.
    [[nodiscard]] std::vector<uint8_t> readBack() const;

    // rename(2) over the target. Throws IOError.
    void commit();

    [[nodiscard]] const std::filesystem::path& path() const { return tmp_; }
    [[nodiscard]] const std::filesystem::path& target() const { return target_; }

private:
    std::filesystem::path target_;
    std::filesystem::path tmp_;
    int fd_ = -1;
    bool committed_ = false;

    void closeFd() noexcept;
};

// Temp file + rename, mode applied before the rename. Throws IOError.
void writeFileAtomic(const std::filesystem::path& path, const std::vector<uint8_t>& data, mode_t mode);

// Creates missing directories of path; new ones get mode and, when given, owner.
void ensureDirectories(const std::filesystem::path& path, mode_t mode,
                       const FileMetadata* owner = nullptr);

// Best-effort unlink. Returns false when the file could not be removed.
bool removeQuietly(const std::filesystem::path& path) noexcept;

}
