#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/CommitRecord.hpp"
#include "core/Settings.hpp"
#include "util/Expected.hpp"

#include <boost/regex.hpp>

namespace czcheck {

/**
 * @brief Result of validating a single commit message
 *
 * reasons may be empty even when passed is false: the canonical validator
 * only says whether a message conforms, rule sets may explain why not.
 */
struct ValidationOutcome {
    bool passed{false};
    std::vector<std::string> reasons;
};

/// A commit that failed validation, with the reasons reported for it
struct FailedCommit {
    CommitRecord commit;
    std::vector<std::string> reasons;
};

/**
 * @brief One commit-message convention
 *
 * A rule set supplies the pattern a conforming message matches and may
 * override how a message is validated and how failures are reported.
 * Concrete rule sets are created by name through RuleRegistry.
 */
class RulePlugin {
public:
    explicit RulePlugin(Settings settings) : settings_(std::move(settings)) {}
    virtual ~RulePlugin() = default;

    /// Registry name, e.g. "cz_conventional_commits"
    virtual const char* name() const = 0;

    /**
     * @brief Pattern a conforming message matches
     * @return The pattern, or std::nullopt to only reject empty messages
     */
    virtual std::optional<std::string> schemaPattern() const = 0;

    /// Human-readable outline of the message layout
    virtual std::optional<std::string> schema() const { return std::nullopt; }
    /// A message that conforms to the convention
    virtual std::optional<std::string> example() const { return std::nullopt; }
    /// Longer description of the convention
    virtual std::optional<std::string> info() const { return std::nullopt; }

    /**
     * @brief Decide whether @p message conforms
     *
     * Checks run in this order and the first that applies decides:
     *   1. empty message            -> passed == allowAbort
     *   2. no pattern               -> passed
     *   3. starts with an allowed
     *      prefix                   -> passed
     *   4. maxMessageLength > 0 and
     *      the trimmed first line is
     *      longer                   -> failed
     *   5. pattern matches at the
     *      start of the message     -> passed, otherwise failed
     */
    virtual ValidationOutcome validateCommitMessage(const std::string& message,
                                                    const std::optional<std::string>& pattern,
                                                    bool allowAbort,
                                                    const std::vector<std::string>& allowedPrefixes,
                                                    int maxMessageLength) const;

    /**
     * @brief Render the report raised when commits fail
     *
     * Lists the revision and message of every failure in order, their
     * reasons when there are any, and the pattern in force.
     */
    virtual std::string formatFailureReport(const std::vector<FailedCommit>& failures) const;

    /**
     * @brief Compile @p pattern ahead of validation
     *
     * The compiled form is kept and reused by every later match against
     * the same pattern. Fails with InvalidConfiguration when the pattern
     * does not compile; an absent pattern always succeeds.
     */
    Expected<void> preparePattern(const std::optional<std::string>& pattern) const;

protected:
    const Settings& settings() const { return settings_; }

    /// Characters (UTF-8 code points) in the first line of @p message, surrounding whitespace excluded
    static size_t firstLineLength(const std::string& message);

    /// Anchored match of @p pattern against @p message
    Expected<bool> patternMatches(const std::string& pattern, const std::string& message) const;

private:
    Settings settings_;
    mutable std::optional<std::pair<std::string, boost::regex>> compiled_;
};

}
