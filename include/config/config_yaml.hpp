#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sm::config;

template<>
struct convert<sm::types::Rule> {
    static Node encode(const sm::types::Rule& rhs) {
        Node node;
        node["source"] = rhs.source;
        node["endpoint"] = rhs.endpoint;
        for (const auto& f : rhs.files) node["files"].push_back(f);
        if (rhs.symlinks_to) node["symlinks_to"] = rhs.symlinks_to->string();
        return node;
    }

    static bool decode(const Node& node, sm::types::Rule& rhs) {
        if (!node.IsMap()) return false;
        rhs.source = node["source"].as<std::string>("");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.files.clear();
        if (const auto files = node["files"]) {
            if (!files.IsSequence()) return false;
            for (const auto& f : files) rhs.files.push_back(f.as<std::string>());
        }
        if (const auto link = node["symlinks_to"]; link && !link.IsNull())
            rhs.symlinks_to = link.as<std::string>();
        else
            rhs.symlinks_to.reset();
        return true;
    }
};

template<>
struct convert<SettingsConfig> {
    static Node encode(const SettingsConfig& rhs) {
        Node node;
        node["jobs"] = rhs.jobs;
        node["fail_fast"] = rhs.fail_fast;
        node["remove_siblings_on_failure"] = rhs.remove_siblings_on_failure;
        node["protect_existing"] = rhs.protect_existing;
        node["verify_source_manifest"] = rhs.verify_source_manifest;
        node["bundle"] = rhs.bundle;
        node["kdf"] = to_string(rhs.kdf);
        return node;
    }

    static bool decode(const Node& node, SettingsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.jobs = node["jobs"].as<unsigned int>(1);
        rhs.fail_fast = node["fail_fast"].as<bool>(false);
        rhs.remove_siblings_on_failure = node["remove_siblings_on_failure"].as<bool>(false);
        rhs.protect_existing = node["protect_existing"].as<bool>(true);
        rhs.verify_source_manifest = node["verify_source_manifest"].as<bool>(true);
        rhs.bundle = node["bundle"].as<bool>(true);
        rhs.kdf = parseKdfStrength(node["kdf"].as<std::string>("moderate"));
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["secrets"]  = to_std_string(spdlog::level::to_string_view(rhs.secrets));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["crypto"]   = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["transfer"] = to_std_string(spdlog::level::to_string_view(rhs.transfer));
        node["verify"]   = to_std_string(spdlog::level::to_string_view(rhs.verify));
        node["shell"]    = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.secrets = spdlog::level::from_str(node["secrets"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.transfer = spdlog::level::from_str(node["transfer"].as<std::string>("info"));
        rhs.verify = spdlog::level::from_str(node["verify"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["file"]              = rhs.file.string();
        node["levels"]            = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        rhs.file = node["file"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
