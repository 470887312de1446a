#include "core/GitLog.hpp"

#include <utility>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/Process.hpp"

namespace czcheck {

namespace {

std::string trimNewlines(const std::string& s) {
    size_t begin = s.find_first_not_of("\r\n");
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of("\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string rstrip(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

}  // namespace

GitCliLog::GitCliLog(std::filesystem::path workingDir) : workingDir(std::move(workingDir)) {}

Expected<std::vector<CommitRecord>> GitCliLog::getCommits(const std::optional<std::string>& range) {
    std::vector<std::string> argv{
        "git", "-c", "log.showSignature=False", "log",
        std::string("--pretty=%H%n%s%n%b") + Constants::GIT_LOG_DELIMITER,
    };
    bool hasRange = range && !range->empty();
    if (hasRange) {
        argv.push_back(*range);
        // Keep the range from being read as a path
        argv.push_back("--");
    }

    auto res = Process::run(argv, workingDir);
    if (!res) return Error{ErrorCode::GitCommandError, res.error().message};

    const ProcessResult& pr = res.value();
    if (pr.exitCode != 0) {
        std::string err = rstrip(pr.err);
        // Listing a repository without commits is an empty result, not a failure
        if (!hasRange && err.find("does not have any commits yet") != std::string::npos) {
            return std::vector<CommitRecord>{};
        }
        return Error{ErrorCode::GitCommandError,
                     err.empty() ? "git log exited with status " + std::to_string(pr.exitCode) : err};
    }

    auto commits = parseLog(pr.out);
    Logger::instance().debug("git log returned " + std::to_string(commits.size()) + " commit(s)");
    return commits;
}

std::vector<CommitRecord> GitCliLog::parseLog(const std::string& output) {
    std::vector<CommitRecord> commits;
    const std::string delimiter = Constants::GIT_LOG_DELIMITER;
    size_t start = 0;
    while (start < output.size()) {
        size_t pos = output.find(delimiter, start);
        std::string chunk = output.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        start = (pos == std::string::npos) ? output.size() : pos + delimiter.size();

        chunk = trimNewlines(chunk);
        if (chunk.empty()) continue;

        // Layout: hash \n subject \n body...
        size_t first = chunk.find('\n');
        std::string rev = chunk.substr(0, first);
        std::string title;
        std::string body;
        if (first != std::string::npos) {
            size_t second = chunk.find('\n', first + 1);
            title = chunk.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
            if (second != std::string::npos) body = rstrip(chunk.substr(second + 1));
        }
        commits.emplace_back(rev, title, body);
    }
    return commits;
}

}
