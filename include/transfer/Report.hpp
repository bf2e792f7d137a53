#pragma once

#include "types/Error.hpp"
#include "types/Operation.hpp"
#include "verify/Report.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sm::transfer {

enum class OperationStatus {
    Success,
    Failed,
    Cancelled,   // never started: run aborted or interrupted
    RolledBack,  // succeeded, then removed because a sibling in its directory failed
};

std::string_view to_string(OperationStatus s);

struct OperationResult {
    types::Operation operation;
    OperationStatus status = OperationStatus::Cancelled;
    std::optional<ErrorKind> kind;
    std::string message;

    [[nodiscard]] bool ok() const { return status == OperationStatus::Success; }
};

struct RunReport {
    types::Direction direction = types::Direction::Export;
    std::vector<OperationResult> results;

    // Closing integrity pass (export only).
    std::optional<verify::Report> closing;

    std::optional<std::string> bundleError;

    bool aborted = false;      // fatal shared-resource failure
    std::string abortReason;
    bool interrupted = false;  // cancelled from outside between operations

    [[nodiscard]] size_t count(OperationStatus s) const;
    [[nodiscard]] std::vector<const OperationResult*> failures() const;
    [[nodiscard]] bool ok() const;
};

void to_json(nlohmann::json& j, const OperationResult& r);
void to_json(nlohmann::json& j, const RunReport& r);

}
