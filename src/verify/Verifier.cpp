#include "verify/Verifier.hpp"
#include "crypto/Digest.hpp"
#include "manifest/Manifest.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace sm::verify;
using namespace sm::manifest;

namespace {

bool namesFileInDirectory(const std::string& name) {
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

}

namespace sm::verify {

void to_json(nlohmann::json& j, const Report& r) {
    j = nlohmann::json::object();
    j["manifests"] = r.manifests;
    j["passed"] = nlohmann::json::array();
    for (const auto& p : r.passed) j["passed"].push_back(p.string());
    j["failed"] = nlohmann::json::array();
    for (const auto& p : r.failed) {
        const auto it = r.reasons.find(p);
        j["failed"].push_back({{"path", p.string()}, {"reason", it != r.reasons.end() ? it->second : ""}});
    }
}

}

Verifier::Verifier() : digest_(std::make_shared<crypto::Sha256Digest>()) {}

Verifier::Verifier(std::shared_ptr<const crypto::Digest> digest) : digest_(std::move(digest)) {}

std::vector<std::filesystem::path> Verifier::discoverManifestDirectories(const std::filesystem::path& root) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw IOError(fmt::format("export root '{}' does not exist or is not a directory", root.string()));

    std::vector<fs::path> dirs;
    if (Manifest::existsIn(root)) dirs.push_back(root);

    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec) && Manifest::existsIn(it->path()))
            dirs.push_back(it->path());
    }
    if (ec) throw IOError(fmt::format("failed to walk export root '{}': {}", root.string(), ec.message()));

    std::ranges::sort(dirs);
    return dirs;
}

Report Verifier::verify(const std::filesystem::path& root) const {
    return verifyDirectories(root, discoverManifestDirectories(root));
}

Report Verifier::verifyDirectories(const std::filesystem::path& root,
                                   const std::vector<std::filesystem::path>& dirs) const {
    Report report;
    for (const auto& dir : dirs) verifyDirectory(root, dir, report);

    log::Registry::verify()->info("[Verifier] {} manifest(s), {} file(s) ok, {} failure(s) under '{}'",
                                  report.manifests, report.passed.size(), report.failed.size(), root.string());
    return report;
}

void Verifier::verifyDirectory(const std::filesystem::path& root, const std::filesystem::path& dir,
                               Report& report) const {
    const auto rel = [&](const std::filesystem::path& p) { return p.lexically_relative(root).lexically_normal(); };
    ++report.manifests;

    Manifest manifest;
    try {
        manifest = Manifest::load(dir);
    } catch (const Error& e) {
        log::Registry::verify()->error("[Verifier] {}", e.what());
        report.fail(rel(dir / MANIFEST_FILE_NAME), e.what());
        return;
    }

    for (const auto& [name, recorded] : manifest.entries()) {
        if (!namesFileInDirectory(name)) {
            const auto reason = fmt::format("lists '{}', which is not a file of this directory", name);
            log::Registry::verify()->error("[Verifier] '{}' {}", (dir / MANIFEST_FILE_NAME).string(), reason);
            report.fail(rel(dir / MANIFEST_FILE_NAME), reason);
            continue;
        }

        const auto file = dir / name;
        try {
            const auto actual = digest_->digestFile(file);
            if (!crypto::Digest::equal(actual, recorded)) {
                log::Registry::verify()->error("[Verifier] '{}' doesn't match its hash in '{}'",
                                               file.string(), (dir / MANIFEST_FILE_NAME).string());
                report.fail(rel(file), "checksum mismatch");
                continue;
            }
            log::Registry::verify()->debug("[Verifier] '{}' ok", file.string());
            report.pass(rel(file));
        } catch (const Error& e) {
            log::Registry::verify()->error("[Verifier] {}", e.what());
            report.fail(rel(file), e.what());
        }
    }
}
