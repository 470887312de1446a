#pragma once

#include "cli/ICommand.hpp"

namespace czcheck {

class ListRulesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "ls"; }
    const char* description() const override { return "List available rule sets"; }
    const char* helpNameLine() const override { return "ls - List the rule sets that can be named in the configuration"; }
    const char* helpSynopsis() const override { return "czcheck ls"; }
    const char* helpDescription() const override { return "Print the name of every registered rule set, one per line."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
