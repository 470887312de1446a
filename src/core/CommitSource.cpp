#include "core/CommitSource.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/CommentFilter.hpp"
#include "util/Logger.hpp"
#include "util/TextDecoder.hpp"

namespace czcheck {

namespace fs = std::filesystem;

namespace {

Expected<std::string> readMessageFile(const std::string& path, const std::string& encoding) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Error{ErrorCode::IoError, "Is a directory: '" + path + "'"};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "No such file or directory: '" + path + "'"};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read '" + path + "'"};
    }
    return TextDecoder::decode(ss.str(), encoding);
}

}  // namespace

const char* toString(SelectionMode mode) {
    switch (mode) {
    case SelectionMode::InlineMessage: return "message";
    case SelectionMode::FileReference: return "commit-msg-file";
    case SelectionMode::RevisionRange: return "rev-range";
    case SelectionMode::StandardInput: return "stdin";
    }
    return "unknown";
}

CommitSource::CommitSource(SelectionMode mode, std::string argument)
    : mode_(mode), argument_(std::move(argument)) {}

Expected<CommitSource> CommitSource::select(const std::optional<std::string>& commitMsgFile,
                                            const std::optional<std::string>& message,
                                            const std::optional<std::string>& revRange,
                                            IInputReader& input) {
    int provided = static_cast<int>(commitMsgFile.has_value()) +
                   static_cast<int>(message.has_value()) +
                   static_cast<int>(revRange.has_value());

    if (provided == 0 && !input.isInteractive()) {
        Logger::instance().debug("No message source given, reading standard input");
        return CommitSource(SelectionMode::StandardInput, input.readAll());
    }
    if (provided != 1) {
        return Error{ErrorCode::InvalidCommandArgument,
                     "Only one of --rev-range, --message, and --commit-msg-file is permitted by check command! "
                     "See 'czcheck help check' for more information"};
    }
    if (commitMsgFile) return CommitSource(SelectionMode::FileReference, *commitMsgFile);
    if (message) return CommitSource(SelectionMode::InlineMessage, *message);
    return CommitSource(SelectionMode::RevisionRange, *revRange);
}

Expected<std::vector<CommitRecord>> CommitSource::resolve(IGitLog& gitLog, const std::string& encoding) const {
    std::string raw;
    switch (mode_) {
    case SelectionMode::RevisionRange:
        return gitLog.getCommits(argument_);
    case SelectionMode::FileReference: {
        auto text = readMessageFile(argument_, encoding);
        if (!text) return text.error();
        raw = TextDecoder::normalizeNewlines(text.value());
        break;
    }
    case SelectionMode::StandardInput:
        raw = TextDecoder::normalizeNewlines(argument_);
        break;
    case SelectionMode::InlineMessage:
        raw = argument_;
        break;
    }
    return std::vector<CommitRecord>{CommitRecord("", "", CommentFilter::filter(raw))};
}

}
