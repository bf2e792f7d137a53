#pragma once

#include "crypto/util/hash.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace sm::manifest {

inline constexpr auto MANIFEST_FILE_NAME = "sha256sums.txt";

// Directory-scoped ledger of "<hex>  <name>" lines, sha256sum compatible.
class Manifest {
public:
    using Entries = std::map<std::string, crypto::DigestValue>;

    Manifest() = default;

    // Throws IntegrityError on a malformed line.
    static Manifest parse(const std::string& text, const std::string& origin = "<manifest>");

    // Missing file yields an empty manifest. Throws IOError / IntegrityError.
    static Manifest load(const std::filesystem::path& dir);

    [[nodiscard]] static bool existsIn(const std::filesystem::path& dir);

    [[nodiscard]] std::string serialize() const;

    // Atomic replace of <dir>/sha256sums.txt. Throws IOError.
    void save(const std::filesystem::path& dir) const;

    void upsert(const std::string& name, const crypto::DigestValue& digest) { entries_[name] = digest; }
    bool erase(const std::string& name) { return entries_.erase(name) > 0; }

    [[nodiscard]] std::optional<crypto::DigestValue> find(const std::string& name) const;
    [[nodiscard]] const Entries& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    Entries entries_;
};

}
