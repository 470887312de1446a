#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/CheckEngine.hpp"
#include "core/Settings.hpp"

namespace czcheck {

/**
 * @brief Parsed `czcheck check` arguments
 *
 * Optional members distinguish "not given" (config default applies) from
 * an explicit value; allowedPrefixes may be given as an empty list.
 */
struct CheckArguments {
    std::optional<std::string> commitMsgFile;
    std::optional<std::string> message;
    std::optional<std::string> revRange;
    bool allowAbort{false};
    std::optional<int> messageLengthLimit;
    std::optional<std::vector<std::string>> allowedPrefixes;
};

class CheckCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "check"; }
    const char* description() const override { return "Validate commit messages"; }
    const char* helpNameLine() const override { return "check - Validate that commit messages follow the configured convention"; }
    const char* helpSynopsis() const override {
        return "czcheck check [--commit-msg-file <path> | -m <message> | --rev-range <range>]\n"
               "              [-a] [-l <n>] [--allowed-prefixes [<prefix>...]]";
    }
    const char* helpDescription() const override {
        return "Check a commit message file (e.g. from a commit-msg hook), a message given on the\n"
               "command line, every commit in a revision range, or a message piped on standard input.\n"
               "All failing commits are reported together.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--commit-msg-file <path>", "Check the message in a file; '#' comments and the verbose diff are ignored."},
            {"-m, --message <message>", "Check the given message."},
            {"--rev-range <range>", "Check every commit in a git revision range, e.g. HEAD~3..HEAD."},
            {"-a, --allow-abort", "Accept an empty message (an aborted commit)."},
            {"-l, --message-length-limit <n>", "Reject messages whose first line exceeds n characters (0 = no limit)."},
            {"--allowed-prefixes [<prefix>...]", "Messages starting with these prefixes skip validation; none = no exemptions."},
        };
    }

    /// Parse check's arguments; InvalidCommandArgument on unknown or incomplete flags
    static Expected<CheckArguments> parseArguments(const std::vector<std::string>& args);

    /// Merge parsed arguments over the configured defaults
    static CheckConfiguration makeConfiguration(const CheckArguments& args, const Settings& settings);
};

}
