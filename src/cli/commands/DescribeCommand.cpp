#include "cli/commands/DescribeCommand.hpp"

#include <iostream>

#include "cli/RuleSetLoader.hpp"

namespace czcheck {

const char* DescribeCommand::name() const {
    switch (topic) {
    case Topic::Schema: return "schema";
    case Topic::Example: return "example";
    case Topic::Info: return "info";
    }
    return "";
}

const char* DescribeCommand::description() const {
    switch (topic) {
    case Topic::Schema: return "Show the commit message schema";
    case Topic::Example: return "Show an example commit message";
    case Topic::Info: return "Show a description of the rule set";
    }
    return "";
}

const char* DescribeCommand::helpNameLine() const {
    switch (topic) {
    case Topic::Schema: return "schema - Show the layout a commit message must follow";
    case Topic::Example: return "example - Show a commit message that passes validation";
    case Topic::Info: return "info - Explain the active commit convention";
    }
    return "";
}

const char* DescribeCommand::helpSynopsis() const {
    switch (topic) {
    case Topic::Schema: return "czcheck [-n <rule-set>] schema";
    case Topic::Example: return "czcheck [-n <rule-set>] example";
    case Topic::Info: return "czcheck [-n <rule-set>] info";
    }
    return "";
}

const char* DescribeCommand::helpDescription() const {
    return "Describe the rule set selected by the configuration or by the global --name option.";
}

Expected<void> DescribeCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidCommandArgument, std::string(name()) + " takes no arguments"};
    }
    auto settings = RuleSetLoader::loadSettings(ctx);
    if (!settings) return settings.error();
    auto rules = RuleSetLoader::loadRuleSet(ctx, settings.value());
    if (!rules) return rules.error();

    const RulePlugin& rule = *rules.value();
    std::optional<std::string> text;
    switch (topic) {
    case Topic::Schema: text = rule.schema(); break;
    case Topic::Example: text = rule.example(); break;
    case Topic::Info: text = rule.info(); break;
    }
    if (!text) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string("rule set '") + rule.name() + "' does not provide " + name()};
    }
    std::cout << *text << "\n";
    return {};
}

}
