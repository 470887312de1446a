#pragma once

#include <string>
#include <vector>

/**
 * @brief Fixed strings and defaults shared across the checker
 */
namespace czcheck {

namespace Constants {
    // Line git writes above the diff in `git commit --verbose` message files
    constexpr const char* VERBOSE_DIFF_DELIMITER = "# ------------------------ >8 ------------------------";

    // Separates commits in the custom `git log` format
    constexpr const char* GIT_LOG_DELIMITER = "----------commit-delimiter----------";

    // Rule set used when configuration does not name one
    constexpr const char* DEFAULT_RULE_SET = "cz_conventional_commits";

    constexpr const char* DEFAULT_ENCODING = "utf-8";

    // Table holding our settings inside a TOML config file
    constexpr const char* CONFIG_TABLE = "tool.commitizen";

    constexpr const char* SUCCESS_MESSAGE = "Commit validation: successful!";

    // Config files searched in each directory, in priority order
    inline const std::vector<std::string> CONFIG_FILES = {"pyproject.toml", ".cz.toml", "cz.toml"};

    // Messages git or common tooling generate; exempt from validation by default
    inline const std::vector<std::string> DEFAULT_ALLOWED_PREFIXES = {
        "Merge", "Revert", "Pull request", "fixup!", "squash!", "amend!"};
}
}
