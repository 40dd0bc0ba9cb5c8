#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace gitcl {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("GITCL_LOG");
    if (!env) return LogLevel::Warn;
    std::string v(env);
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Warn;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::error(const std::string& msg) const { if (enabled(LogLevel::Error)) std::cerr << "[error] " << msg << "\n"; }
void Logger::warn(const std::string& msg) const { if (enabled(LogLevel::Warn)) std::cerr << "[warn ] " << msg << "\n"; }
void Logger::info(const std::string& msg) const { if (enabled(LogLevel::Info)) std::cout << "[info ] " << msg << "\n"; }
void Logger::debug(const std::string& msg) const { if (enabled(LogLevel::Debug)) std::cout << "[debug] " << msg << "\n"; }

}
