#pragma once

#include <string>

namespace czcheck {

/**
 * @brief Source of piped input for the stdin selection mode
 */
class IInputReader {
public:
    virtual ~IInputReader() = default;
    /// True if input comes from a terminal rather than a pipe or file
    virtual bool isInteractive() const = 0;
    /// Consume and return everything remaining on the input
    virtual std::string readAll() = 0;
};

/**
 * @brief Destination for user-facing notices
 */
class IOutput {
public:
    virtual ~IOutput() = default;
    virtual void success(const std::string& message) = 0;
    /// Report a failed command; @p message may span several lines
    virtual void failure(const std::string& message) = 0;
};

/// Reads the process's standard input
class ConsoleInput : public IInputReader {
public:
    bool isInteractive() const override;
    std::string readAll() override;
};

/// Prints success notices in green on stdout, failures in red on stderr
class ConsoleOutput : public IOutput {
public:
    void success(const std::string& message) override;
    void failure(const std::string& message) override;
};

}
