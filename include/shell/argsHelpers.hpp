#pragma once

#include "shell/types.hpp"

#include <optional>
#include <string>

namespace sm::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);

std::optional<unsigned int> parseUInt(const std::string& s);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

}
