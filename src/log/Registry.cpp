#include "log/Registry.hpp"

#include <stdexcept>
#include <vector>

namespace sm::log {

namespace {

const std::vector<std::string>& loggerNames() {
    static const std::vector<std::string> names = {"secrets", "config", "crypto", "transfer", "verify", "shell"};
    return names;
}

spdlog::level::level_enum levelFor(const std::string& name, const config::SubsystemLogLevelsConfig& lv) {
    if (name == "secrets") return lv.secrets;
    if (name == "config") return lv.config;
    if (name == "crypto") return lv.crypto;
    if (name == "transfer") return lv.transfer;
    if (name == "verify") return lv.verify;
    if (name == "shell") return lv.shell;
    return spdlog::level::info;
}

}

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        applyLevels(cnf);
        return;
    }

    // console goes to stderr so command output on stdout stays machine readable
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    for (const auto& name : loggerNames()) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{console_sink_});
        logger->set_level(levelFor(name, cnf.levels));
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    attachFileSink(cnf);
}

void Registry::attachFileSink(const config::LoggingConfig& cnf) {
    if (cnf.file.empty() || file_sink_) return;

    namespace fs = std::filesystem;
    std::error_code ec;
    if (cnf.file.has_parent_path()) fs::create_directories(cnf.file.parent_path(), ec);

    try {
        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cnf.file.string(), file_max_bytes_, file_max_files_);
    } catch (const spdlog::spdlog_ex& e) {
        secrets()->warn("[Registry] Could not open log file '{}': {}", cnf.file.string(), e.what());
        return;
    }
    file_sink_->set_level(cnf.file_log_level);
    file_sink_->set_pattern(LOG_FORMAT);

    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) { lg->sinks().push_back(file_sink_); });
}

void Registry::applyLevels(const config::LoggingConfig& cnf) {
    if (!initialized_) return;
    console_sink_->set_level(cnf.console_log_level);
    for (const auto& name : loggerNames())
        if (const auto lg = spdlog::get(name)) lg->set_level(levelFor(name, cnf.levels));
    if (file_sink_) file_sink_->set_level(cnf.file_log_level);
    else attachFileSink(cnf);
}

void Registry::setVerbose() {
    if (!initialized_) return;
    console_sink_->set_level(spdlog::level::debug);
    for (const auto& name : loggerNames())
        if (const auto lg = spdlog::get(name)) lg->set_level(spdlog::level::debug);
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] log Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
