#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/ExitCode.hpp"
#include "rules/RuleRegistry.hpp"

namespace czcheck {

namespace {

void printSection(const char* title, const std::string& body) {
    std::cout << title << ":\n" << body << "\n\n";
}

void printCommandDetail(const ICommand& cmd) {
    printSection("NAME", cmd.helpNameLine());
    printSection("SYNOPSIS", cmd.helpSynopsis());
    printSection("DESCRIPTION", cmd.helpDescription());
    auto opts = cmd.helpOptions();
    if (opts.empty()) return;
    std::cout << "OPTIONS:\n";
    for (const auto& [opt, desc] : opts) {
        std::cout << "  " << opt << "\n      " << desc << "\n";
    }
    std::cout << "\n";
}

void printOverview() {
    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    std::cout << "usage: czcheck [--config <path>] [-n <rule-set>] [--debug] <command> [<args>]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }

    std::cout << "\nGlobal options:\n"
              << "  --config <path>\tRead settings from this file instead of searching for one\n"
              << "  -n, --name <rule-set>\tUse this rule set instead of the configured one\n"
              << "  --debug\t\tPrint debug logging\n";

    std::cout << "\nRule sets:\n";
    for (const auto& n : RuleRegistry::instance().names()) {
        std::cout << "  " << n << "\n";
    }

    std::cout << "\nExit status:\n"
              << "  " << ExitCode::SUCCESS << "\tall checked messages are valid\n"
              << "  " << ExitCode::NO_COMMITS_FOUND << "\tthe revision range selected no commits\n"
              << "  " << ExitCode::INVALID_COMMIT_MSG << "\tat least one message failed validation\n"
              << "  " << ExitCode::INVALID_COMMAND_ARGUMENT << "\tbad command-line arguments\n"
              << "  " << ExitCode::INVALID_CONFIGURATION << "\tbad configuration or schema pattern\n"
              << "  " << ExitCode::GIT_COMMAND_ERROR << "\tgit log failed\n"
              << "Run 'czcheck help <command>' for the options of one command.\n";
}

}  // namespace

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidCommandArgument, "help takes at most one command name"};
    }
    if (!args.empty()) {
        const std::string& topic = args.front();
        if (!CommandFactory::instance().contains(topic)) {
            return Error{ErrorCode::InvalidCommandArgument, "Unknown help topic: " + topic};
        }
        printCommandDetail(*CommandFactory::instance().create(topic));
        return {};
    }
    printOverview();
    return {};
}

}
