#include "shell/Session.hpp"
#include "shell/argsHelpers.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <fmt/core.h>

using namespace sm::shell;
using namespace sm::config;

void Session::loadConfig(const CommandCall& call) {
    std::optional<std::filesystem::path> path;

    if (const auto opt = optVal(call, "config")) {
        if (opt->empty()) throw ConfigError("--config requires a path");
        if (!std::filesystem::exists(*opt)) throw ConfigError(fmt::format("config file '{}' does not exist", *opt));
        path = *opt;
    } else {
        path = paths::findConfigPath();
    }

    if (!path) {
        log::Registry::config()->debug("[Session] No config file found, running with defaults");
        config = Config{};
        configLoaded = false;
        return;
    }

    log::Registry::config()->info("[Session] Using config '{}'", path->string());
    config = sm::config::loadConfig(*path);
    configLoaded = true;
}

sm::crypto::Passphrase Session::acquirePassphrase(const bool confirm) const {
    if (passphraseSource) return passphraseSource(confirm);
    if (auto fromEnv = crypto::Passphrase::fromEnv()) {
        log::Registry::crypto()->debug("[Session] Passphrase taken from {}", crypto::Passphrase::ENV_VAR);
        return std::move(*fromEnv);
    }
    return crypto::Passphrase::prompt(confirm);
}

sm::crypto::util::KdfLimits Session::limits() const {
    if (kdfLimits) return *kdfLimits;
    switch (config.settings.kdf) {
        case KdfStrength::Interactive: return crypto::util::KdfLimits::interactive();
        case KdfStrength::Sensitive: return crypto::util::KdfLimits::sensitive();
        case KdfStrength::Moderate: break;
    }
    return crypto::util::KdfLimits::moderate();
}

std::string sm::shell::profileFor(const CommandCall& call) {
    if (const auto p = optVal(call, "profile")) return *p;
    return paths::getHostname();
}

sm::transfer::EngineOptions sm::shell::engineOptionsFor(const CommandCall& call, const SettingsConfig& settings) {
    auto options = transfer::EngineOptions::from(settings);

    if (const auto jobs = optVal(call, "jobs")) {
        const auto n = parseUInt(*jobs);
        if (!n || *n == 0) throw ConfigError(fmt::format("--jobs must be a positive integer, got '{}'", *jobs));
        options.jobs = *n;
    }

    if (hasFlag(call, "fail-fast")) options.fail_fast = true;
    return options;
}
