#include "shell/Parser.hpp"

using namespace sm::shell;

void sm::shell::setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

CommandCall sm::shell::parseArgs(const std::vector<std::string>& args,
                                 const std::unordered_set<std::string>& booleanFlags) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(4);

    bool stop_flags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        if (!stop_flags && a == "--") {
            stop_flags = true;
            continue;
        }

        const bool isFlag = !stop_flags && a.size() > 1 && a[0] == '-';
        if (!isFlag) {
            if (call.name.empty()) call.name = a;
            else call.positionals.push_back(a);
            continue;
        }

        std::string key = a.substr(a[1] == '-' ? 2 : 1);

        if (const auto eq = key.find('='); eq != std::string::npos) {
            setOpt(call, key.substr(0, eq), key.substr(eq + 1));
            continue;
        }

        if (!booleanFlags.contains(key) && i + 1 < args.size() && args[i + 1] != "--") {
            setOpt(call, key, args[i + 1]);
            ++i; // consumed value
            continue;
        }

        setOpt(call, key, std::nullopt);
    }

    return call;
}
