#include "util/PatternMatcher.hpp"

#include <stdexcept>

namespace czcheck {
namespace PatternMatcher {

namespace {

Error badPattern(const std::string& pattern, const std::string& why) {
    return Error{ErrorCode::InvalidConfiguration, "Invalid schema pattern '" + pattern + "': " + why};
}

}  // namespace

Expected<std::string> toPerl(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() + 8);
    bool inClass = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            char next = pattern[i + 1];
            if (!inClass && next == 'Z') {
                out += "\\z";
            } else {
                out += c;
                out += next;
            }
            ++i;
            continue;
        }
        if (inClass) {
            if (c == ']') inClass = false;
            out += c;
            continue;
        }
        if (c == '[') {
            inClass = true;
            out += c;
            // A ']' right after '[' or '[^' is literal
            if (i + 1 < pattern.size() && pattern[i + 1] == '^') {
                out += '^';
                ++i;
            }
            if (i + 1 < pattern.size() && pattern[i + 1] == ']') {
                out += ']';
                ++i;
            }
            continue;
        }
        if (c == '(' && pattern.compare(i, 4, "(?P=") == 0) {
            size_t close = pattern.find(')', i);
            if (close == std::string::npos) {
                return badPattern(pattern, "unterminated backreference");
            }
            out += "\\k<" + pattern.substr(i + 4, close - i - 4) + ">";
            i = close;
            continue;
        }
        if (c == '(' && pattern.compare(i, 4, "(?P<") == 0) {
            out += "(?<";
            i += 3;
            continue;
        }
        out += c;
    }
    return out;
}

Expected<boost::regex> compile(const std::string& pattern) {
    auto perl = toPerl(pattern);
    if (!perl) return perl.error();
    try {
        return boost::regex(perl.value(), boost::regex::perl | boost::regex::no_mod_m | boost::regex::no_mod_s);
    } catch (const boost::regex_error& e) {
        return badPattern(pattern, e.what());
    }
}

Expected<bool> matchesAtStart(const boost::regex& re, const std::string& text) {
    try {
        return boost::regex_search(text.begin(), text.end(), re,
                                   boost::match_default | boost::match_continuous);
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string("Schema pattern is too complex for this message: ") + e.what()};
    }
}

}  // namespace PatternMatcher
}  // namespace czcheck
