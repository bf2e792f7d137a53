#include "shell/argsHelpers.hpp"

#include <charconv>

using namespace sm::shell;

CommandResult sm::shell::invalid(std::string msg) { return {2, "", std::move(msg)}; }
CommandResult sm::shell::ok(std::string out) { return {0, std::move(out), ""}; }

std::optional<std::string> sm::shell::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool sm::shell::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

std::optional<unsigned int> sm::shell::parseUInt(const std::string& s) {
    unsigned int value = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (s.empty() || ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}
