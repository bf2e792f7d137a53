#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "shell/argsHelpers.hpp"

#include <version.h>

using namespace sm::shell;

static CommandResult handle_version(const CommandCall&) {
    return ok("secrets-manager v" + std::string(SM_VERSION) + "\n");
}

void sm::shell::registerSystemCommands(Router& r) {
    r.registerCommand("version", "version", "Print the version", handle_version);
}
