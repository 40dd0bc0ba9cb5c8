#pragma once

#include <string>

namespace gitcl {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Initial level comes from the GITCL_LOG environment variable
 * (error|warn|info|debug or 0..3, default warn). Errors and warnings
 * go to stderr; info and debug lines go to stdout.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return currentLevel >= level; }
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
};

}
