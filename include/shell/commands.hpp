#pragma once

#include <memory>

namespace sm::shell {

class Router;
struct Session;

void registerTransferCommands(Router& r, const std::shared_ptr<Session>& session);
void registerVerifyCommands(Router& r);
void registerSystemCommands(Router& r);

inline void registerAllCommands(Router& r, const std::shared_ptr<Session>& session) {
    registerTransferCommands(r, session);
    registerVerifyCommands(r);
    registerSystemCommands(r);
}

}
