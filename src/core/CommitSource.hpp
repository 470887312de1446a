#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/CommitRecord.hpp"
#include "core/Console.hpp"
#include "core/GitLog.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/// Where the messages to check come from
enum class SelectionMode {
    InlineMessage,   // --message <text>
    FileReference,   // --commit-msg-file <path>
    RevisionRange,   // --rev-range <range>
    StandardInput    // nothing given, input piped in
};

const char* toString(SelectionMode mode);

/**
 * @brief Resolves which commits a check run validates
 *
 * Exactly one of the three explicit sources may be given; an empty string
 * counts as given. With none, piped standard input is used as the message.
 *
 * Messages from a file, --message or stdin are comment-filtered and
 * wrapped in one synthetic CommitRecord. Revision ranges are listed from
 * git history as-is.
 */
class CommitSource {
public:
    CommitSource() = default;

    /**
     * @brief Pick the selection mode from the command-line sources
     * @param commitMsgFile Value of --commit-msg-file, if given
     * @param message Value of --message, if given
     * @param revRange Value of --rev-range, if given
     * @param input Standard input; read in full when no source is given
     *              and it is not interactive
     * @return The source, or InvalidCommandArgument if zero (with an
     *         interactive input) or several sources are given
     */
    static Expected<CommitSource> select(const std::optional<std::string>& commitMsgFile,
                                         const std::optional<std::string>& message,
                                         const std::optional<std::string>& revRange,
                                         IInputReader& input);

    SelectionMode mode() const { return mode_; }

    /// The path, message text or revision range, depending on mode()
    const std::string& argument() const { return argument_; }

    /**
     * @brief Produce the commits to validate
     * @param gitLog History accessor, used only for RevisionRange
     * @param encoding Encoding of the message file, used only for FileReference
     * @return Commits in source order; IoError / UnrecognizedEncoding for an
     *         unreadable file, GitCommandError if git fails
     */
    Expected<std::vector<CommitRecord>> resolve(IGitLog& gitLog, const std::string& encoding) const;

private:
    CommitSource(SelectionMode mode, std::string argument);

    SelectionMode mode_{SelectionMode::InlineMessage};
    std::string argument_;
};

}
