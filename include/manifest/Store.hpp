#pragma once

#include "manifest/Manifest.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace sm::manifest {

// Per-directory manifests shared by the operations of one run. Every
// mutation is serialised by the directory's own mutex and persisted before
// the call returns.
class Store {
public:
    // Adds or replaces the entry and rewrites the directory's manifest.
    // Throws IOError when the manifest cannot be written.
    void record(const std::filesystem::path& dir, const std::string& name, const crypto::DigestValue& digest);

    // Removes the entry if present and rewrites the manifest.
    void forget(const std::filesystem::path& dir, const std::string& name);

    // Snapshot of the directory's manifest (loaded from disk on first use).
    Manifest snapshot(const std::filesystem::path& dir);

    // Directories whose manifest was written during this run.
    [[nodiscard]] std::vector<std::filesystem::path> writtenDirectories() const;

private:
    struct Slot {
        std::mutex mutex;
        bool loaded = false;
        Manifest manifest;
    };

    std::shared_ptr<Slot> slotFor(const std::filesystem::path& dir);
    static void ensureLoaded(Slot& slot, const std::filesystem::path& dir);

    mutable std::mutex mapMutex_;
    std::map<std::filesystem::path, std::shared_ptr<Slot>> slots_;
    std::set<std::filesystem::path> written_;
};

}
