#include "core/CheckEngine.hpp"

#include <utility>

#include "util/Logger.hpp"

namespace czcheck {

CheckEngine::CheckEngine(CheckConfiguration config, const RulePlugin& rules, CommitSource source,
                         IGitLog& gitLog, IOutput& output)
    : config(std::move(config)), rules(rules), source(std::move(source)), gitLog(gitLog), output(output) {}

Expected<std::vector<FailedCommit>> CheckEngine::validate(const std::vector<CommitRecord>& commits) const {
    const auto pattern = rules.schemaPattern();
    auto ready = rules.preparePattern(pattern);
    if (!ready) return ready.error();

    std::vector<FailedCommit> failed;
    for (const auto& commit : commits) {
        ValidationOutcome outcome = rules.validateCommitMessage(
            commit.message(), pattern, config.allowAbort, config.allowedPrefixes, config.maxMessageLength);
        if (!outcome.passed) {
            Logger::instance().debug("Commit '" + commit.shortRevision() + "' failed validation");
            failed.push_back(FailedCommit{commit, std::move(outcome.reasons)});
        }
    }
    return failed;
}

Expected<void> CheckEngine::run() {
    Logger::instance().debug(std::string("Selection mode: ") + toString(source.mode()));

    auto commits = source.resolve(gitLog, config.encoding);
    if (!commits) return commits.error();
    if (commits.value().empty()) {
        return Error{ErrorCode::NoCommitsFound, "No commit found with range: '" + source.argument() + "'"};
    }

    Logger::instance().debug("Validating " + std::to_string(commits.value().size()) + " commit(s)");
    auto failed = validate(commits.value());
    if (!failed) return failed.error();
    if (!failed.value().empty()) {
        return Error{ErrorCode::InvalidCommitMessage, rules.formatFailureReport(failed.value())};
    }

    output.success(Constants::SUCCESS_MESSAGE);
    return {};
}

}
