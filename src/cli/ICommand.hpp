#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Console.hpp"
#include "core/GitLog.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Global options and services shared by every command
 *
 * Defaults talk to the real process environment; tests swap in fakes.
 */
struct AppContext {
    std::filesystem::path cwd;                              // empty = current directory
    std::optional<std::filesystem::path> configPath;        // --config
    std::optional<std::string> ruleSetName;                 // --name, overrides the config
    std::shared_ptr<IGitLog> gitLog{std::make_shared<GitCliLog>()};
    std::shared_ptr<IInputReader> input{std::make_shared<ConsoleInput>()};
    std::shared_ptr<IOutput> output{std::make_shared<ConsoleOutput>()};
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

}
