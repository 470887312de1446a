#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/CommitRecord.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Read access to commit history
 */
class IGitLog {
public:
    virtual ~IGitLog() = default;

    /**
     * @brief List commits in a revision range
     * @param range Anything `git log` accepts ("HEAD~3..HEAD", "main", a
     *              hash); std::nullopt or an empty string lists every
     *              commit reachable from HEAD
     * @return Commits in the order git reports them (newest first)
     */
    virtual Expected<std::vector<CommitRecord>> getCommits(const std::optional<std::string>& range) = 0;
};

/**
 * @brief IGitLog backed by the `git` executable
 *
 * Runs:
 *   git -c log.showSignature=False log --pretty=%H%n%s%n%b<delimiter> [range]
 *
 * and splits the output on the delimiter. A non-zero exit status becomes
 * ErrorCode::GitCommandError carrying git's stderr.
 */
class GitCliLog : public IGitLog {
public:
    explicit GitCliLog(std::filesystem::path workingDir = {});

    Expected<std::vector<CommitRecord>> getCommits(const std::optional<std::string>& range) override;

    /// Parse output produced by the format above
    static std::vector<CommitRecord> parseLog(const std::string& output);

private:
    std::filesystem::path workingDir;
};

}
