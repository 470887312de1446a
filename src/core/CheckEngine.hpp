#pragma once

#include <string>
#include <vector>

#include "core/CommitSource.hpp"
#include "core/Console.hpp"
#include "core/Constants.hpp"
#include "core/GitLog.hpp"
#include "rules/RulePlugin.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Policy applied to every commit in a check run
 */
struct CheckConfiguration {
    bool allowAbort{false};
    int maxMessageLength{0};   // 0 = unlimited
    std::vector<std::string> allowedPrefixes;
    std::string encoding{Constants::DEFAULT_ENCODING};
};

/**
 * @brief Runs one validation pass over the selected commits
 *
 * Every commit is validated, in source order, even after a failure, so
 * the report lists all offending commits at once.
 */
class CheckEngine {
public:
    CheckEngine(CheckConfiguration config, const RulePlugin& rules, CommitSource source,
                IGitLog& gitLog, IOutput& output);

    /**
     * @brief Validate the selected commits
     *
     * Errors:
     *   NoCommitsFound       - the source produced no commits
     *   InvalidCommitMessage - at least one commit failed; the message is
     *                          the rule set's failure report
     *   InvalidConfiguration - the rule set's pattern does not compile
     *   plus whatever the source reports while reading (IoError, ...)
     *
     * On success a notice is sent to the output.
     */
    Expected<void> run();

    /**
     * @brief Validate @p commits and return the failures in input order
     *
     * The rule set's pattern is compiled once up front; InvalidConfiguration
     * if it does not compile.
     */
    Expected<std::vector<FailedCommit>> validate(const std::vector<CommitRecord>& commits) const;

private:
    CheckConfiguration config;
    const RulePlugin& rules;
    CommitSource source;
    IGitLog& gitLog;
    IOutput& output;
};

}
