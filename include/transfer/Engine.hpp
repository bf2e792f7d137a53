#pragma once

#include "config/Config.hpp"
#include "manifest/Store.hpp"
#include "transfer/Report.hpp"
#include "types/Operation.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sm::crypto {
class Cipher;
class Digest;
}

namespace sm::transfer {

struct EngineOptions {
    unsigned int jobs = 1;
    bool fail_fast = false;
    bool remove_siblings_on_failure = false;
    bool protect_existing = true;
    bool verify_source_manifest = true;

    static EngineOptions from(const config::SettingsConfig& s);
};

// Extra plaintext files copied into the export root beside the secrets.
struct Bundle {
    std::string config_name;
    std::string config_text;
    std::optional<std::filesystem::path> executable;
};

class Engine {
public:
    Engine(EngineOptions options,
           std::shared_ptr<const crypto::Digest> digest,
           std::shared_ptr<const crypto::Cipher> cipher,
           std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // Encrypts every operation into destination, writes the manifests, then
    // re-verifies every manifest it wrote.
    RunReport runExport(const std::vector<types::Operation>& ops,
                        const std::filesystem::path& destination,
                        const std::optional<Bundle>& bundle = std::nullopt);

    // Verifies, decrypts and places every operation from an export tree.
    RunReport runImport(const std::vector<types::Operation>& ops,
                        const std::filesystem::path& sourceRoot);

private:
    using Step = std::function<OperationResult(const types::Operation&)>;

    EngineOptions options_;
    std::shared_ptr<const crypto::Digest> digest_;
    std::shared_ptr<const crypto::Cipher> cipher_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;

    std::unique_ptr<manifest::Store> store_;

    std::atomic<bool> stop_{false};
    std::mutex abortMutex_;
    std::optional<std::string> abortReason_;

    std::vector<OperationResult> execute(const std::vector<types::Operation>& ops, const Step& step);
    OperationResult guarded(const types::Operation& op, const Step& step);

    OperationResult exportOne(const types::Operation& op, const std::filesystem::path& destination);
    OperationResult importOne(const types::Operation& op, const std::filesystem::path& sourceRoot);

    void checkSourceManifest(const std::filesystem::path& source, const crypto::DigestValue& digest) const;
    void recordManifest(const std::filesystem::path& dir, const std::string& name, const crypto::DigestValue& digest);
    void placeSymlink(const std::filesystem::path& target, const std::filesystem::path& link) const;
    void rollBackSiblings(std::vector<OperationResult>& results, const std::filesystem::path& destination);
    void writeBundle(const Bundle& bundle, const std::filesystem::path& destination, RunReport& report);

    void abort(const std::string& reason);
    [[nodiscard]] bool cancelled() const;
    void reset();
};

}
