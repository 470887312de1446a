#pragma once

#include <string>

#include <boost/regex.hpp>

#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Compiles and applies commit-message schema patterns
 *
 * Schema patterns are written in the Python `re` dialect. They are
 * compiled with Boost.Regex in Perl mode, which already understands
 * inline flags ((?i), (?s), (?m), (?x), anywhere in the pattern), \A,
 * lookarounds and named groups. Only the Python spellings Perl lacks are
 * rewritten first:
 *
 *   (?P<name>...)  -> (?<name>...)
 *   (?P=name)      -> \k<name>
 *   \Z             -> \z          end of text only
 *
 * As in Python, '.' does not match a newline and '^'/'$' anchor to the
 * whole text unless the pattern turns on (?s) or (?m).
 *
 * Boost's matcher keeps its backtracking state on the heap, so long
 * commit bodies cannot exhaust the call stack.
 */
namespace PatternMatcher {

/// Rewrite the Python-only constructs of @p pattern into Perl syntax
Expected<std::string> toPerl(const std::string& pattern);

/**
 * @brief Rewrite and compile a schema pattern
 * @return Compiled regex, or InvalidConfiguration if the pattern is not valid
 */
Expected<boost::regex> compile(const std::string& pattern);

/**
 * @brief Test whether @p re matches a prefix of @p text
 *
 * Anchored at the start of @p text but not required to consume all of it,
 * i.e. Python's re.match rather than re.fullmatch. Fails with
 * InvalidConfiguration when matching exceeds Boost's complexity limit.
 */
Expected<bool> matchesAtStart(const boost::regex& re, const std::string& text);

}  // namespace PatternMatcher

}  // namespace czcheck
