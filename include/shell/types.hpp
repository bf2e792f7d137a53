#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sm::shell {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success, 1 = failures, 2 = usage/config
    std::string stdout_text;
    std::string stderr_text;
    nlohmann::json data;               // machine-readable report, printed with --json
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string usage;                 // e.g. "export <destination>"
    std::string description;
    CommandHandler handler;
};

}
