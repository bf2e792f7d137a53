#pragma once

#include "types/Operation.hpp"
#include "types/Rule.hpp"

#include <string>
#include <vector>

namespace sm::rules {

struct Resolver {
    // Shared rules first, then the profile's own, files in declared order.
    // An empty result means there is nothing to do. Throws ConfigError when
    // the profile name is unusable or a rule expands to an invalid path.
    static std::vector<types::Operation> resolve(const types::RuleSet& rules,
                                                 const std::string& profile,
                                                 types::Direction direction);

    // Replaces every "$profile" token.
    static std::string substituteProfile(const std::string& s, const std::string& profile);
};

}
