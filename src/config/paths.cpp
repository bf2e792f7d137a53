#include "config/paths.hpp"
#include "types/Error.hpp"

#include <unistd.h>
#include <climits>
#include <cstdlib>
#include <string>

namespace sm::paths {

std::optional<std::filesystem::path> getUserConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) base = xdg;
    else if (const char* home = std::getenv("HOME"); home && *home) base = std::filesystem::path(home) / ".config";
    else return std::nullopt;
    return base / CONFIG_DIR_NAME / CONFIG_FILE_NAME;
}

std::optional<std::filesystem::path> findConfigPath() {
    std::error_code ec;
    if (const auto user = getUserConfigPath(); user && std::filesystem::exists(*user, ec)) return user;
    if (const std::filesystem::path local = std::filesystem::path(".") / CONFIG_FILE_NAME;
        std::filesystem::exists(local, ec))
        return local;
    return std::nullopt;
}

std::filesystem::path getExecutablePath() {
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) throw IOError("failed to obtain executable path: " + ec.message());
    return p;
}

std::string getHostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0)
        throw ConfigError("failed to read the host name; pass --profile explicitly");
    return {buf};
}

}
