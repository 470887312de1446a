#pragma once

#include <string>
#include <utility>

namespace czcheck {

/**
 * @brief One commit whose message is to be validated
 *
 * Records built from `git log` carry the full revision hash, the subject
 * line as title and the remaining text as body. Records built from a
 * message file, --message or stdin are synthetic: empty revision and
 * title, the whole (comment-filtered) text as body.
 */
class CommitRecord {
public:
    CommitRecord() = default;
    CommitRecord(std::string revision, std::string title, std::string body)
        : revision_(std::move(revision)), title_(std::move(title)), body_(std::move(body)) {}

    const std::string& revision() const { return revision_; }
    const std::string& title() const { return title_; }
    const std::string& body() const { return body_; }

    /**
     * @brief Full commit message: title, blank line, body
     *
     * Leading and trailing whitespace is removed, so a synthetic record
     * (empty title) yields its body without the separator.
     */
    std::string message() const {
        std::string full = title_ + "\n\n" + body_;
        const char* ws = " \t\n\r\f\v";
        size_t begin = full.find_first_not_of(ws);
        if (begin == std::string::npos) return {};
        size_t end = full.find_last_not_of(ws);
        return full.substr(begin, end - begin + 1);
    }

    /// First 7 characters of the revision
    std::string shortRevision() const {
        return revision_.length() >= 7 ? revision_.substr(0, 7) : revision_;
    }

private:
    std::string revision_;
    std::string title_;
    std::string body_;
};

}
