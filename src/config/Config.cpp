#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "rules/Resolver.hpp"
#include "types/Error.hpp"

#include <cctype>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <set>
#include <sstream>

namespace sm::config {

using namespace sm::types;

namespace {

std::optional<std::string> relativePathProblem(const std::string& raw) {
    const std::filesystem::path p(raw);
    if (p.empty()) return "is empty";
    if (p.has_root_directory() || p.has_root_name()) return "must be a relative path";
    for (const auto& c : p) {
        if (c == ".") return "must be normalized but contains '.'";
        if (c == "..") return "must be normalized but contains '..'";
    }
    return std::nullopt;
}

std::optional<std::string> absolutePathProblem(const std::string& raw) {
    const std::filesystem::path p(raw);
    if (p.empty()) return "is empty";
    if (!p.is_absolute()) return "must be an absolute path";
    for (const auto& c : p)
        if (c == "..") return "must be normalized but contains '..'";
    return std::nullopt;
}

std::optional<std::string> fileNameProblem(const std::string& name) {
    if (name.empty()) return "is empty";
    if (name == "." || name == "..") return "is not a file name";
    if (name.find('/') != std::string::npos) return "must be a single file name without '/'";
    // sha256sums.txt lines cannot carry these unescaped
    if (name.find('\\') != std::string::npos) return "must not contain '\\'";
    for (const unsigned char c : name)
        if (std::iscntrl(c)) return "must not contain control characters";
    return std::nullopt;
}

void validateRule(const Direction dir, const std::string& profile, const size_t index, const Rule& rule) {
    const auto where = fmt::format("{}.{}[{}]", to_string(dir) + "s", profile, index);

    if (rule.files.empty())
        throw ConfigError(fmt::format("{}: 'files' must list at least one file", where));

    const auto& relative = dir == Direction::Export ? rule.endpoint : rule.source;
    const auto& absolute = dir == Direction::Export ? rule.source : rule.endpoint;
    const auto relKey = dir == Direction::Export ? "endpoint" : "source";
    const auto absKey = dir == Direction::Export ? "source" : "endpoint";

    if (const auto problem = relativePathProblem(relative))
        throw ConfigError(fmt::format("{}: {} '{}' {}", where, relKey, relative, *problem));
    if (const auto problem = absolutePathProblem(absolute))
        throw ConfigError(fmt::format("{}: {} '{}' {}", where, absKey, absolute, *problem));

    if (rule.symlinks_to) {
        if (dir == Direction::Export)
            throw ConfigError(fmt::format("{}: 'symlinks_to' is only valid on import rules", where));
        if (const auto problem = absolutePathProblem(rule.symlinks_to->string()))
            throw ConfigError(fmt::format("{}: symlinks_to '{}' {}", where, rule.symlinks_to->string(), *problem));
    }

    std::set<std::string> seen;
    for (const auto& f : rule.files) {
        if (const auto problem = fileNameProblem(f))
            throw ConfigError(fmt::format("{}: file '{}' {}", where, f, *problem));
        if (!seen.insert(f).second)
            throw ConfigError(fmt::format("{}: file '{}' is declared multiple times", where, f));
    }
}

// An export artefact belongs to exactly one profile.
void validateExportOwnership(const ProfileRules& exports) {
    std::map<std::string, std::string> literalOwner;

    for (const auto& [profile, rules] : exports) {
        if (profile == SHARED_PROFILE) continue;
        for (const auto& rule : rules) {
            if (rule.endpoint.find(PROFILE_TOKEN) != std::string::npos) continue;
            for (const auto& f : rule.files) {
                const auto key = (std::filesystem::path(rule.endpoint) / f).string();
                const auto [it, inserted] = literalOwner.emplace(key, profile);
                if (!inserted && it->second != profile)
                    throw ConfigError(fmt::format(
                        "secret '{}' is exported (hence owned) by multiple profiles: '{}', '{}'",
                        key, it->second, profile));
            }
        }
    }

    const auto shared = exports.find(SHARED_PROFILE);
    for (const auto& [profile, rules] : exports) {
        if (profile == SHARED_PROFILE) continue;

        std::set<std::string> keys;
        auto claim = [&](const Rule& rule) {
            for (const auto& f : rule.files) {
                const auto key = (std::filesystem::path(sm::rules::Resolver::substituteProfile(rule.endpoint, profile)) / f).string();
                if (!keys.insert(key).second)
                    throw ConfigError(fmt::format(
                        "profile '{}' exports '{}' from more than one rule", profile, key));
            }
        };

        if (shared != exports.end())
            for (const auto& rule : shared->second) claim(rule);
        for (const auto& rule : rules) claim(rule);
    }
}

ProfileRules decodeProfiles(const YAML::Node& node, const std::string& section) {
    ProfileRules out;
    if (!node) return out;
    if (node.IsNull()) return out;
    if (!node.IsMap())
        throw ConfigError(fmt::format("'{}' must map profile names to lists of rules", section));

    for (const auto& kv : node) {
        const auto profile = kv.first.as<std::string>();
        const auto& list = kv.second;
        if (!list.IsSequence())
            throw ConfigError(fmt::format("'{}.{}' must be a list of rules", section, profile));

        auto& rules = out[profile];
        for (const auto& item : list) {
            Rule r;
            if (!YAML::convert<Rule>::decode(item, r))
                throw ConfigError(fmt::format("'{}.{}' contains a malformed rule", section, profile));
            rules.push_back(std::move(r));
        }
    }
    return out;
}

}

void validate(const RuleSet& rules) {
    for (const auto dir : {Direction::Export, Direction::Import}) {
        for (const auto& [profile, list] : rules.forDirection(dir)) {
            if (profile.empty()) throw ConfigError("profile names cannot be empty");
            for (size_t i = 0; i < list.size(); ++i) validateRule(dir, profile, i, list[i]);
        }
    }
    validateExportOwnership(rules.exports);
}

Config parseConfig(const std::string& yaml, const std::filesystem::path& origin) {
    Config cfg;
    cfg.source_path = origin;
    cfg.source_text = yaml;

    const auto label = origin.empty() ? std::string("<inline>") : origin.string();

    try {
        const YAML::Node root = YAML::Load(yaml);
        if (root && !root.IsNull() && !root.IsMap())
            throw ConfigError(fmt::format("config '{}' must be a mapping at top level", label));

        cfg.rules.exports = decodeProfiles(root["exports"], "exports");
        cfg.rules.imports = decodeProfiles(root["imports"], "imports");

        if (const auto node = root["settings"]) {
            if (!YAML::convert<SettingsConfig>::decode(node, cfg.settings))
                throw ConfigError(fmt::format("config '{}': 'settings' must be a mapping", label));
        }
        if (const auto node = root["logging"]) {
            if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
                throw ConfigError(fmt::format("config '{}': 'logging' must be a mapping", label));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("failed to parse config file at path '{}'\n{}", label, e.what()));
    }

    if (cfg.settings.jobs == 0) cfg.settings.jobs = 1;

    try {
        validate(cfg.rules);
    } catch (const ConfigError& e) {
        throw ConfigError(fmt::format("invalid config file at path '{}'\n{}", label, e.what()));
    }

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError(fmt::format("failed to read config file at path '{}'", path.string()));

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseConfig(buffer.str(), path);
}

std::string to_string(const KdfStrength k) {
    switch (k) {
        case KdfStrength::Interactive: return "interactive";
        case KdfStrength::Moderate: return "moderate";
        case KdfStrength::Sensitive: return "sensitive";
    }
    return "moderate";
}

KdfStrength parseKdfStrength(const std::string& s) {
    if (s == "interactive") return KdfStrength::Interactive;
    if (s == "moderate") return KdfStrength::Moderate;
    if (s == "sensitive") return KdfStrength::Sensitive;
    throw ConfigError("invalid kdf strength '" + s + "' (expected interactive, moderate or sensitive)");
}

void to_json(nlohmann::json& j, const SettingsConfig& c) {
    j = {
        {"jobs", c.jobs},
        {"fail_fast", c.fail_fast},
        {"remove_siblings_on_failure", c.remove_siblings_on_failure},
        {"protect_existing", c.protect_existing},
        {"verify_source_manifest", c.verify_source_manifest},
        {"bundle", c.bundle},
        {"kdf", to_string(c.kdf)}
    };
}

}
