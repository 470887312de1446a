#include "cli/commands/ListRulesCommand.hpp"

#include <iostream>

#include "rules/RuleRegistry.hpp"

namespace czcheck {

Expected<void> ListRulesCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidCommandArgument, "ls takes no arguments"};
    }
    for (const auto& n : RuleRegistry::instance().names()) {
        std::cout << n << "\n";
    }
    return {};
}

}
