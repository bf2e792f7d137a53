#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "log/Registry.hpp"
#include "types/Error.hpp"

#include <cctype>
#include <fmt/core.h>

using namespace sm::shell;
using namespace sm::log;

void Router::registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler) {
    const auto key = normalize(name);
    if (commands_.contains(key)) {
        Registry::shell()->warn("[Router] Command '{}' already registered; keeping the first one", key);
        return;
    }
    commands_[key] = CommandInfo{std::move(usage), std::move(description), std::move(handler)};
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty() || call.name == "help" || hasFlag(call, "help") || hasFlag(call, "h")) {
        if (call.name.empty() && !hasFlag(call, "help") && !hasFlag(call, "h"))
            return {2, helpText(), "No command provided."};
        return ok(helpText());
    }

    const auto key = normalize(call.name);
    Registry::shell()->debug("[Router] Executing command: '{}'", key);

    const auto it = commands_.find(key);
    if (it == commands_.end())
        return {2, helpText(), fmt::format("Unknown command: {}", call.name)};

    try {
        return it->second.handler(call);
    } catch (const ConfigError& e) {
        Registry::shell()->error("[Router] {}: {}", key, e.what());
        return invalid(fmt::format("{}: {}", key, e.what()));
    } catch (const std::exception& e) {
        Registry::shell()->error("[Router] {} failed: {}", key, e.what());
        return {1, "", fmt::format("{}: {}", key, e.what())};
    }
}

std::string Router::helpText() const {
    std::string out = "Usage: secrets-manager [options] <command> [args]\n\nCommands:\n";
    for (const auto& [name, info] : commands_)
        out += fmt::format("  {:<28} {}\n", info.usage, info.description);

    out += "\nOptions:\n"
           "  --config PATH                config file (default: $XDG_CONFIG_HOME/secrets-manager/secrets-manager.yaml)\n"
           "  --profile NAME               profile to run (default: host name)\n"
           "  --jobs N                     operations run in parallel\n"
           "  --fail-fast                  stop after the first failed operation\n"
           "  --json                       print the report as JSON\n"
           "  -v, --verbose                debug logging on the console\n";
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}
