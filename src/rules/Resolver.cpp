#include "rules/Resolver.hpp"
#include "types/Error.hpp"

#include <fmt/core.h>

using namespace sm::rules;
using namespace sm::types;

namespace {

void requireUsableProfile(const std::string& profile) {
    if (profile.empty()) throw sm::ConfigError("profile name cannot be empty");
    if (profile == SHARED_PROFILE)
        throw sm::ConfigError(fmt::format("'{}' is reserved for rules applying to every machine", SHARED_PROFILE));
    if (profile.find('/') != std::string::npos || profile == "." || profile == "..")
        throw sm::ConfigError(fmt::format("profile '{}' cannot be used as a path component", profile));
}

void expandRule(std::vector<Operation>& out, const Rule& rule, const std::string& group,
                const std::string& profile, const Direction direction) {
    const std::filesystem::path source = Resolver::substituteProfile(rule.source, profile);
    const std::filesystem::path endpoint = Resolver::substituteProfile(rule.endpoint, profile);

    const auto& relative = direction == Direction::Export ? endpoint : source;
    for (const auto& c : relative)
        if (c == ".." || c == ".")
            throw sm::ConfigError(fmt::format("{}.{}: '{}' is not a normalized relative path after substitution",
                                          to_string(direction) + "s", group, relative.string()));

    for (const auto& file : rule.files) {
        Operation op;
        op.action = direction;
        op.profile = group;

        if (direction == Direction::Export) {
            op.source_path = source / file;
            op.endpoint_path = endpoint / (file + CIPHERTEXT_EXTENSION);
        } else {
            op.source_path = source / (file + CIPHERTEXT_EXTENSION);
            op.endpoint_path = endpoint / file;
            if (rule.symlinks_to) op.symlink_target = *rule.symlinks_to / file;
        }

        out.push_back(std::move(op));
    }
}

}

std::string Resolver::substituteProfile(const std::string& s, const std::string& profile) {
    const std::string token = PROFILE_TOKEN;
    std::string out = s;
    for (auto pos = out.find(token); pos != std::string::npos; pos = out.find(token, pos + profile.size()))
        out.replace(pos, token.size(), profile);
    return out;
}

std::vector<Operation> Resolver::resolve(const RuleSet& rules, const std::string& profile, const Direction direction) {
    requireUsableProfile(profile);

    const auto& groups = rules.forDirection(direction);
    std::vector<Operation> ops;

    for (const auto& group : {std::string(SHARED_PROFILE), profile}) {
        const auto it = groups.find(group);
        if (it == groups.end()) continue;
        for (const auto& rule : it->second) expandRule(ops, rule, group, profile, direction);
    }

    return ops;
}
