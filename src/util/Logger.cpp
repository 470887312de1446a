#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace czcheck {

LogLevel Logger::parseLevel(const std::string& text, LogLevel fallback) {
    std::string v(text);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return fallback;
}

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("CZCHECK_LOG");
    if (!env) return LogLevel::Warn;
    return Logger::parseLevel(env, LogLevel::Warn);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()), out(&std::cout), err(&std::cerr) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setStreams(std::ostream& o, std::ostream& e) {
    out = &o;
    err = &e;
}

void Logger::resetStreams() {
    out = &std::cout;
    err = &std::cerr;
}

// Continuation lines are indented under the tag
void Logger::write(std::ostream& os, const char* tag, const std::string& msg) const {
    os << tag << ' ';
    for (char c : msg) {
        os << c;
        if (c == '\n') os << "        ";
    }
    os << '\n';
}

void Logger::error(const std::string& msg) const { if (currentLevel >= LogLevel::Error) write(*err, "[error]", msg); }
void Logger::warn(const std::string& msg) const { if (currentLevel >= LogLevel::Warn) write(*err, "[warn ]", msg); }
void Logger::info(const std::string& msg) const { if (currentLevel >= LogLevel::Info) write(*out, "[info ]", msg); }
void Logger::debug(const std::string& msg) const { if (currentLevel >= LogLevel::Debug) write(*out, "[debug]", msg); }

}
