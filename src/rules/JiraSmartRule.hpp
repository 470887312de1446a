#pragma once

#include "rules/RulePlugin.hpp"

namespace czcheck {

/**
 * @brief Jira smart-commit messages
 *
 *   <ignored text> <ISSUE_KEY> <ignored text> #<COMMAND> <arguments>
 *
 * e.g. "JRA-34 #comment corrected indent issue". The issue key is two or
 * more capitals, a dash and a number.
 */
class JiraSmartRule : public RulePlugin {
public:
    using RulePlugin::RulePlugin;

    const char* name() const override { return "cz_jira"; }
    std::optional<std::string> schemaPattern() const override;
    std::optional<std::string> schema() const override;
    std::optional<std::string> example() const override;
    std::optional<std::string> info() const override;
};

}
