#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/Session.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/render.hpp"
#include "config/paths.hpp"
#include "crypto/Cipher.hpp"
#include "crypto/Digest.hpp"
#include "log/Registry.hpp"
#include "rules/Resolver.hpp"
#include "transfer/Engine.hpp"

#include <fmt/core.h>

using namespace sm::shell;
using namespace sm::types;
using namespace sm::transfer;
using namespace sm::crypto;
using namespace sm::log;

namespace {

CommandResult toResult(const RunReport& report) {
    CommandResult res;
    res.exit_code = report.ok() ? 0 : 1;
    res.stdout_text = renderRunReport(report);
    res.data = report;
    res.has_data = true;
    return res;
}

Engine makeEngine(const CommandCall& call, const Session& session, const bool confirm) {
    auto passphrase = std::make_shared<const Passphrase>(session.acquirePassphrase(confirm));
    auto cipher = std::make_shared<const PassphraseCipher>(std::move(passphrase), session.limits());
    return Engine(engineOptionsFor(call, session.config.settings), std::make_shared<const Sha256Digest>(),
                  std::move(cipher), session.interruptFlag);
}

CommandResult handle_export(const CommandCall& call, const Session& session) {
    if (call.positionals.size() != 1) return invalid("export: expected exactly one <destination>");
    if (!session.configLoaded) return invalid("export: no configuration file found, pass --config");

    const auto profile = profileFor(call);
    const auto ops = sm::rules::Resolver::resolve(session.config.rules, profile, Direction::Export);
    if (ops.empty()) return ok(fmt::format("export: no rules for profile '{}', nothing to do\n", profile));

    const auto destination = std::filesystem::absolute(call.positionals[0]);
    Registry::secrets()->info("[export] profile '{}', {} file(s) -> '{}'", profile, ops.size(), destination.string());

    // validates --jobs before asking for the passphrase
    engineOptionsFor(call, session.config.settings);

    std::optional<Bundle> bundle;
    if (session.config.settings.bundle)
        bundle = Bundle{
            .config_name = sm::paths::CONFIG_FILE_NAME,
            .config_text = session.config.source_text,
            .executable = session.executable ? *session.executable : sm::paths::getExecutablePath(),
        };

    auto engine = makeEngine(call, session, true);
    const auto report = engine.runExport(ops, destination, bundle);

    Registry::secrets()->info("[export] finished, {}", report.ok() ? "all files verified" : "with failures");
    return toResult(report);
}

CommandResult handle_import(const CommandCall& call, const Session& session) {
    if (call.positionals.size() != 1) return invalid("import: expected exactly one <source>");
    if (!session.configLoaded) return invalid("import: no configuration file found, pass --config");

    const auto profile = profileFor(call);
    const auto ops = sm::rules::Resolver::resolve(session.config.rules, profile, Direction::Import);
    if (ops.empty()) return ok(fmt::format("import: no rules for profile '{}', nothing to do\n", profile));

    const auto source = std::filesystem::absolute(call.positionals[0]);
    if (!std::filesystem::is_directory(source))
        return invalid(fmt::format("import: '{}' is not a directory", source.string()));

    Registry::secrets()->info("[import] profile '{}', {} file(s) <- '{}'", profile, ops.size(), source.string());

    engineOptionsFor(call, session.config.settings);

    auto engine = makeEngine(call, session, false);
    const auto report = engine.runImport(ops, source);

    Registry::secrets()->info("[import] finished, {}", report.ok() ? "all files placed" : "with failures");
    return toResult(report);
}

}

void sm::shell::registerTransferCommands(Router& r, const std::shared_ptr<Session>& session) {
    r.registerCommand("export", "export <destination>",
                      "Encrypt this profile's secrets into an export tree and verify it",
                      [session](const CommandCall& call) { return handle_export(call, *session); });
    r.registerCommand("import", "import <source>",
                      "Verify, decrypt and place this profile's secrets from an export tree",
                      [session](const CommandCall& call) { return handle_import(call, *session); });
}
