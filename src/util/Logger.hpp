#pragma once

#include <iosfwd>
#include <string>

namespace czcheck {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * The initial level comes from the CZCHECK_LOG environment variable
 * ("error", "warn", "info", "debug" or 0..3, case-insensitive). Errors and
 * warnings go to stderr, info and debug to stdout.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    /// Redirect output; tests pass string streams
    void setStreams(std::ostream& out, std::ostream& err);
    /// Back to std::cout / std::cerr
    void resetStreams();

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    static LogLevel parseLevel(const std::string& text, LogLevel fallback);

private:
    Logger();
    void write(std::ostream& os, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    std::ostream* out;
    std::ostream* err;
};

}
