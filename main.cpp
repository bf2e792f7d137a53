#include "log/Registry.hpp"
#include "shell/Parser.hpp"
#include "shell/Router.hpp"
#include "shell/Session.hpp"
#include "shell/argsHelpers.hpp"
#include "shell/commands.hpp"
#include "types/Error.hpp"

#include <atomic>
#include <csignal>
#include <fmt/core.h>
#include <string>
#include <vector>

using namespace sm::log;
using namespace sm::shell;

namespace {
std::atomic<bool>* interruptFlag = nullptr;

void signalHandler(const int) {
    if (interruptFlag) interruptFlag->store(true);
}
}

int main(int argc, char** argv) {
    const auto call = parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    const bool verbose = hasFlag(call, "verbose") || hasFlag(call, "v");

    Registry::init();
    if (verbose) Registry::setVerbose();

    const auto session = std::make_shared<Session>();
    try {
        session->loadConfig(call);
    } catch (const sm::ConfigError& e) {
        fmt::print(stderr, "secrets-manager: {}\n", e.what());
        return 2;
    }

    Registry::applyLevels(session->config.logging);
    if (verbose) Registry::setVerbose();

    interruptFlag = session->interruptFlag.get();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Router router;
    registerAllCommands(router, session);

    const auto result = router.execute(call);

    if (hasFlag(call, "json") && result.has_data) fmt::print("{}\n", result.data.dump(2));
    else if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);

    if (!result.stderr_text.empty()) fmt::print(stderr, "{}\n", result.stderr_text);

    if (session->interruptFlag->load())
        Registry::secrets()->warn("Interrupted, operations already started were completed");

    return result.exit_code;
}
