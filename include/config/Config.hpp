#pragma once

#include "types/Rule.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sm::config {

enum class KdfStrength { Interactive, Moderate, Sensitive };

struct SettingsConfig {
    unsigned int jobs = 1;                    // >1 runs operations on the worker pool
    bool fail_fast = false;                   // stop scheduling after the first failed operation
    bool remove_siblings_on_failure = false;  // drop this run's ciphertexts in a directory that had a failure
    bool protect_existing = true;             // import never replaces a different existing plaintext
    bool verify_source_manifest = true;       // honour a sha256sums.txt found beside the export source
    bool bundle = true;                       // copy config and executable into the export root
    KdfStrength kdf = KdfStrength::Moderate;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum secrets  = spdlog::level::info;   // Command lifecycle
    spdlog::level::level_enum config   = spdlog::level::info;   // Config lookup and validation
    spdlog::level::level_enum crypto   = spdlog::level::warn;   // Key derivation, encrypt/decrypt failures
    spdlog::level::level_enum transfer = spdlog::level::info;   // Per-operation progress
    spdlog::level::level_enum verify   = spdlog::level::info;   // Manifest checks
    spdlog::level::level_enum shell    = spdlog::level::info;   // Argument parsing and dispatch
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    std::filesystem::path file;               // empty disables the file sink
    SubsystemLogLevelsConfig levels;
};

struct Config {
    types::RuleSet rules;
    SettingsConfig settings;
    LoggingConfig logging;

    std::filesystem::path source_path;        // file the config was read from, empty for defaults
    std::string source_text;                  // raw file content, re-emitted by the export bundle
};

// Reads and validates a config file. Throws ConfigError.
Config loadConfig(const std::filesystem::path& path);

// Parses and validates config text. Throws ConfigError.
Config parseConfig(const std::string& yaml, const std::filesystem::path& origin = {});

// Structural checks over the rule set. Throws ConfigError.
void validate(const types::RuleSet& rules);

std::string to_string(KdfStrength k);
KdfStrength parseKdfStrength(const std::string& s);

void to_json(nlohmann::json& j, const SettingsConfig& c);

}
