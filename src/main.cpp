// czcheck entry point: global options, then dispatch through the command factory.

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ExitCode.hpp"
#include "cli/ICommand.hpp"
#include "rules/RuleRegistry.hpp"
#include "util/Logger.hpp"

using namespace czcheck;

int main(int argc, char** argv) {
    registerCommands();
    registerBuiltinRules(RuleRegistry::instance());

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    AppContext ctx{};
    CommandInvoker invoker;

    // Global options precede the command name
    size_t pos = 0;
    while (pos < args.size() && args[pos].rfind("-", 0) == 0) {
        const std::string& opt = args[pos];
        if (opt == "--debug") {
            Logger::instance().setLevel(LogLevel::Debug);
            ++pos;
        } else if ((opt == "--config" || opt == "-n" || opt == "--name") && pos + 1 < args.size()) {
            if (opt == "--config") {
                ctx.configPath = args[pos + 1];
            } else {
                ctx.ruleSetName = args[pos + 1];
            }
            pos += 2;
        } else if (opt == "-h" || opt == "--help") {
            args[pos] = "help";
            break;
        } else {
            std::cerr << "Unknown or incomplete option: " << opt << "\n";
            return ExitCode::INVALID_COMMAND_ARGUMENT;
        }
    }
    args.erase(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(pos));

    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        auto res = invoker.invoke(*cmd, ctx, {});
        return res ? ExitCode::SUCCESS : ExitCode::forError(res.error().code);
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    if (!CommandFactory::instance().contains(cmdName)) {
        std::cerr << "Unknown command: " << cmdName << "\n"
                  << "Run 'czcheck help' to list the available commands.\n";
        return ExitCode::INVALID_COMMAND_ARGUMENT;
    }
    auto cmd = CommandFactory::instance().create(cmdName);
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? ExitCode::SUCCESS : ExitCode::forError(res.error().code);
}
