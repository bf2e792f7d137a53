#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sm::types {

enum class Direction { Export, Import };

// Profile whose rules apply to every machine.
inline constexpr auto SHARED_PROFILE = "shared";

// Token substituted with the active profile name in source and endpoint.
inline constexpr auto PROFILE_TOKEN = "$profile";

struct Rule {
    std::string source;
    std::string endpoint;
    std::vector<std::string> files;
    std::optional<std::filesystem::path> symlinks_to;
};

using ProfileRules = std::map<std::string, std::vector<Rule>>;

struct RuleSet {
    ProfileRules exports;
    ProfileRules imports;

    [[nodiscard]] const ProfileRules& forDirection(const Direction d) const {
        return d == Direction::Export ? exports : imports;
    }
};

std::string to_string(Direction d);

}
