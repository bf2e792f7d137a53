#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/render.hpp"
#include "log/Registry.hpp"
#include "verify/Verifier.hpp"

#include <fmt/core.h>

using namespace sm::shell;

namespace {

CommandResult handle_verify_export(const CommandCall& call) {
    if (call.positionals.size() != 1) return invalid("verify-export: expected exactly one <export-root>");

    const auto root = std::filesystem::absolute(call.positionals[0]);
    if (!std::filesystem::is_directory(root))
        return invalid(fmt::format("verify-export: '{}' is not a directory", root.string()));

    const sm::verify::Verifier verifier;
    const auto report = verifier.verify(root);

    sm::log::Registry::secrets()->info("[verify-export] {} passed, {} failed", report.passed.size(), report.failed.size());

    CommandResult res;
    res.exit_code = report.ok() ? 0 : 1;
    res.stdout_text = renderVerifyReport(report, root);
    res.data = report;
    res.has_data = true;
    return res;
}

}

void sm::shell::registerVerifyCommands(Router& r) {
    r.registerCommand("verify-export", "verify-export <export-root>",
                      "Re-check every manifest of an export tree", handle_verify_export);
}
