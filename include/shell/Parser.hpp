#pragma once

#include "shell/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace sm::shell {

// Flags that never take a value. Any other flag consumes the next argument
// unless it is written as --key=value.
inline const std::unordered_set<std::string> BOOLEAN_FLAGS{
    "json", "fail-fast", "verbose", "v", "help", "h", "version"
};

// Upsert a flag (last wins)
void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val);

// argv (without the program name) -> command call. The first bare word is the
// command name; flags may appear anywhere; "--" ends flag parsing.
CommandCall parseArgs(const std::vector<std::string>& args,
                      const std::unordered_set<std::string>& booleanFlags = BOOLEAN_FLAGS);

}
