#include "shell/render.hpp"

#include <fmt/core.h>

using namespace sm::transfer;

namespace {

// The path a user finds in the export tree: endpoint for export, source for import.
std::string relativePathOf(const OperationResult& r, const sm::types::Direction d) {
    return (d == sm::types::Direction::Export ? r.operation.endpoint_path : r.operation.source_path).string();
}

void appendVerification(std::string& out, const sm::verify::Report& v, const std::string& heading) {
    out += fmt::format("{}: {} passed, {} failed across {} manifest(s)\n",
                       heading, v.passed.size(), v.failed.size(), v.manifests);
    for (const auto& p : v.failed) {
        const auto it = v.reasons.find(p);
        out += fmt::format("  MISMATCH  {}{}\n", p.string(),
                           it == v.reasons.end() ? "" : fmt::format("  ({})", it->second));
    }
}

}

std::string sm::shell::renderRunReport(const RunReport& report) {
    std::string out = fmt::format("{}: {} succeeded, {} failed, {} cancelled",
                                  types::to_string(report.direction),
                                  report.count(OperationStatus::Success),
                                  report.count(OperationStatus::Failed),
                                  report.count(OperationStatus::Cancelled));
    if (const auto rolled = report.count(OperationStatus::RolledBack)) out += fmt::format(", {} rolled back", rolled);
    out += "\n";

    for (const auto* r : report.failures()) {
        if (r->status == OperationStatus::Cancelled) continue;
        out += fmt::format("  {:<11} {}  [{}] {}\n",
                           r->status == OperationStatus::Failed ? "FAILED" : "ROLLED BACK",
                           relativePathOf(*r, report.direction),
                           r->kind ? std::string(to_string(*r->kind)) : std::string(to_string(r->status)),
                           r->message);
    }

    if (report.aborted) out += fmt::format("run aborted: {}\n", report.abortReason);
    if (report.interrupted) out += "run interrupted, remaining operations were not started\n";
    if (report.bundleError) out += fmt::format("bundle failed: {}\n", *report.bundleError);

    if (report.closing) appendVerification(out, *report.closing, "closing verification");
    return out;
}

std::string sm::shell::renderVerifyReport(const verify::Report& report, const std::filesystem::path& root) {
    std::string out;
    appendVerification(out, report, fmt::format("verify-export {}", root.string()));
    return out;
}
