#pragma once

#include "rules/RulePlugin.hpp"

namespace czcheck {

/**
 * @brief Conventional Commits 1.0 (https://www.conventionalcommits.org)
 *
 *   <type>(<scope>)!: <subject>
 *
 *   <body>
 *
 *   <footer>
 *
 * type is one of build, bump, chore, ci, docs, feat, fix, perf, refactor,
 * revert, style, test. Scope and '!' are optional; the subject must be
 * on the first line and body/footer must follow a blank line.
 */
class ConventionalCommitsRule : public RulePlugin {
public:
    using RulePlugin::RulePlugin;

    const char* name() const override { return "cz_conventional_commits"; }
    std::optional<std::string> schemaPattern() const override;
    std::optional<std::string> schema() const override;
    std::optional<std::string> example() const override;
    std::optional<std::string> info() const override;
};

}
