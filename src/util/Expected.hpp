#pragma once

#include <string>
#include <utility>

namespace czcheck {

enum class ErrorCode {
    None = 0,
    InvalidCommandArgument,
    NoCommitsFound,
    InvalidCommitMessage,
    NoRuleSetFound,
    MissingCustomizeConfig,
    InvalidConfiguration,
    ConfigFileNotFound,
    UnrecognizedEncoding,
    GitCommandError,
    IoError,
    InternalError
};

inline const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::InvalidCommandArgument: return "InvalidCommandArgument";
    case ErrorCode::NoCommitsFound: return "NoCommitsFound";
    case ErrorCode::InvalidCommitMessage: return "InvalidCommitMessage";
    case ErrorCode::NoRuleSetFound: return "NoRuleSetFound";
    case ErrorCode::MissingCustomizeConfig: return "MissingCustomizeConfig";
    case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
    case ErrorCode::ConfigFileNotFound: return "ConfigFileNotFound";
    case ErrorCode::UnrecognizedEncoding: return "UnrecognizedEncoding";
    case ErrorCode::GitCommandError: return "GitCommandError";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::InternalError: return "InternalError";
    }
    return "Unknown";
}

/// A failure: what kind, plus the text shown to the user
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}
