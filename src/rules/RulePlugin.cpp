#include "rules/RulePlugin.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace czcheck {

size_t RulePlugin::firstLineLength(const std::string& message) {
    std::string line = message.substr(0, message.find('\n'));
    const char* ws = " \t\r\f\v";
    size_t begin = line.find_first_not_of(ws);
    if (begin == std::string::npos) return 0;
    size_t end = line.find_last_not_of(ws);
    // Continuation bytes (10xxxxxx) do not start a character
    return static_cast<size_t>(std::count_if(line.begin() + begin, line.begin() + end + 1,
                                             [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

Expected<void> RulePlugin::preparePattern(const std::optional<std::string>& pattern) const {
    if (!pattern) return {};
    if (compiled_ && compiled_->first == *pattern) return {};
    auto re = PatternMatcher::compile(*pattern);
    if (!re) return re.error();
    Logger::instance().debug("Compiled schema pattern for " + std::string(name()));
    compiled_ = std::make_pair(*pattern, std::move(re.value()));
    return {};
}

Expected<bool> RulePlugin::patternMatches(const std::string& pattern, const std::string& message) const {
    auto ready = preparePattern(pattern);
    if (!ready) return ready.error();
    return PatternMatcher::matchesAtStart(compiled_->second, message);
}

ValidationOutcome RulePlugin::validateCommitMessage(const std::string& message,
                                                    const std::optional<std::string>& pattern,
                                                    bool allowAbort,
                                                    const std::vector<std::string>& allowedPrefixes,
                                                    int maxMessageLength) const {
    if (message.empty()) {
        return {allowAbort, {}};
    }
    if (!pattern) {
        return {true, {}};
    }
    bool exempt = std::any_of(allowedPrefixes.begin(), allowedPrefixes.end(),
                              [&](const std::string& p) { return message.rfind(p, 0) == 0; });
    if (exempt) {
        return {true, {}};
    }
    if (maxMessageLength > 0 && firstLineLength(message) > static_cast<size_t>(maxMessageLength)) {
        return {false, {}};
    }
    auto matched = patternMatches(*pattern, message);
    if (!matched) return {false, {matched.error().message}};
    return {matched.value(), {}};
}

std::string RulePlugin::formatFailureReport(const std::vector<FailedCommit>& failures) const {
    std::ostringstream os;
    os << "commit validation: failed!\n"
       << "please enter a commit message in the " << name() << " format.\n";
    for (const auto& f : failures) {
        os << "commit \"" << f.commit.revision() << "\": \"" << f.commit.message() << "\"\n";
        if (!f.reasons.empty()) {
            os << "errors:\n";
            for (const auto& r : f.reasons) os << "- " << r << "\n";
        }
    }
    auto pattern = schemaPattern();
    os << "pattern: " << (pattern ? *pattern : std::string("<none>"));
    return os.str();
}

}
