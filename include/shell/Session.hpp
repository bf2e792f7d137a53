#pragma once

#include "config/Config.hpp"
#include "crypto/Passphrase.hpp"
#include "crypto/util/encrypt.hpp"
#include "shell/types.hpp"
#include "transfer/Engine.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sm::shell {

// What one invocation of the tool runs with: the loaded config, the
// cancellation flag raised by SIGINT/SIGTERM and the passphrase source.
struct Session {
    config::Config config;
    bool configLoaded = false;

    std::shared_ptr<std::atomic<bool>> interruptFlag = std::make_shared<std::atomic<bool>>(false);

    // Empty: SECRETS_MANAGER_PASSPHRASE, then the terminal.
    std::function<crypto::Passphrase(bool confirm)> passphraseSource;

    // Overrides settings.kdf when set.
    std::optional<crypto::util::KdfLimits> kdfLimits;

    // Binary copied by the export bundle; the running executable when unset.
    std::optional<std::filesystem::path> executable;

    // --config, then the user config, then ./secrets-manager.yaml. Leaves
    // configLoaded false when nothing was found. Throws ConfigError.
    void loadConfig(const CommandCall& call);

    [[nodiscard]] crypto::Passphrase acquirePassphrase(bool confirm) const;
    [[nodiscard]] crypto::util::KdfLimits limits() const;
};

// --profile, or the host name.
std::string profileFor(const CommandCall& call);

// settings overlaid with --jobs and --fail-fast. Throws ConfigError on a bad --jobs.
transfer::EngineOptions engineOptionsFor(const CommandCall& call, const config::SettingsConfig& settings);

}
