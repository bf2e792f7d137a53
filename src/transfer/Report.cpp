#include "transfer/Report.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace sm::transfer {

std::string_view to_string(const OperationStatus s) {
    switch (s) {
        case OperationStatus::Success: return "success";
        case OperationStatus::Failed: return "failed";
        case OperationStatus::Cancelled: return "cancelled";
        case OperationStatus::RolledBack: return "rolled-back";
    }
    return "unknown";
}

size_t RunReport::count(const OperationStatus s) const {
    return static_cast<size_t>(std::ranges::count_if(results, [s](const auto& r) { return r.status == s; }));
}

std::vector<const OperationResult*> RunReport::failures() const {
    std::vector<const OperationResult*> out;
    for (const auto& r : results)
        if (!r.ok()) out.push_back(&r);
    return out;
}

bool RunReport::ok() const {
    if (aborted || interrupted || bundleError) return false;
    if (closing && !closing->ok()) return false;
    return std::ranges::all_of(results, [](const auto& r) { return r.ok(); });
}

void to_json(nlohmann::json& j, const OperationResult& r) {
    j = {
        {"source", r.operation.source_path.string()},
        {"endpoint", r.operation.endpoint_path.string()},
        {"profile", r.operation.profile},
        {"status", std::string(to_string(r.status))}
    };
    if (r.operation.symlink_target) j["symlink"] = r.operation.symlink_target->string();
    if (r.kind) j["kind"] = std::string(to_string(*r.kind));
    if (!r.message.empty()) j["message"] = r.message;
}

void to_json(nlohmann::json& j, const RunReport& r) {
    j = {
        {"direction", types::to_string(r.direction)},
        {"ok", r.ok()},
        {"operations", r.results},
        {"succeeded", r.count(OperationStatus::Success)},
        {"failed", r.count(OperationStatus::Failed)},
        {"cancelled", r.count(OperationStatus::Cancelled)},
        {"rolled_back", r.count(OperationStatus::RolledBack)},
        {"aborted", r.aborted},
        {"interrupted", r.interrupted}
    };
    if (r.aborted) j["abort_reason"] = r.abortReason;
    if (r.closing) j["closing_verification"] = *r.closing;
    if (r.bundleError) j["bundle_error"] = *r.bundleError;
}

}
