#pragma once

#include "cli/ICommand.hpp"

namespace czcheck {

class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show help for commands"; }
    const char* helpNameLine() const override { return "help - Display help information about czcheck"; }
    const char* helpSynopsis() const override { return "czcheck help [<command>]"; }
    const char* helpDescription() const override { return "Without arguments, list commands, global options, rule sets and exit statuses. With a command name, show its usage and options."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
