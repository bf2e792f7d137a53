#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sm::verify {

// Paths are relative to the verified export root.
struct Report {
    std::set<std::filesystem::path> passed;
    std::set<std::filesystem::path> failed;
    std::map<std::filesystem::path, std::string> reasons;
    size_t manifests = 0;

    [[nodiscard]] bool ok() const { return failed.empty(); }

    void pass(const std::filesystem::path& p) { passed.insert(p); }

    void fail(const std::filesystem::path& p, std::string reason) {
        passed.erase(p);
        failed.insert(p);
        reasons[p] = std::move(reason);
    }
};

void to_json(nlohmann::json& j, const Report& r);

}
