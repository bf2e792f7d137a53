#pragma once

#include "shell/types.hpp"

#include <map>
#include <string>

namespace sm::shell {

class Router {
public:
    void registerCommand(const std::string& name, std::string usage, std::string description, CommandHandler handler);

    // Dispatches to the handler. Errors escaping a handler become exit
    // code 2 (ConfigError) or 1 (anything else).
    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string helpText() const;

private:
    std::map<std::string, CommandInfo> commands_;

    static std::string normalize(const std::string& s);
};

}
