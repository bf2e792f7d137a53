#pragma once

#include "verify/Report.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace sm::crypto { class Digest; }

namespace sm::verify {

// Re-checks manifests of an export tree. Read-only.
class Verifier {
public:
    Verifier();
    explicit Verifier(std::shared_ptr<const crypto::Digest> digest);

    // Every sha256sums.txt below root. Throws IOError when root is not a directory.
    [[nodiscard]] Report verify(const std::filesystem::path& root) const;

    // Only the manifests of the given directories (absolute, under root).
    [[nodiscard]] Report verifyDirectories(const std::filesystem::path& root,
                                           const std::vector<std::filesystem::path>& dirs) const;

    static std::vector<std::filesystem::path> discoverManifestDirectories(const std::filesystem::path& root);

private:
    std::shared_ptr<const crypto::Digest> digest_;

    void verifyDirectory(const std::filesystem::path& root, const std::filesystem::path& dir, Report& report) const;
};

}
