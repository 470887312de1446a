#include "rules/ConventionalCommitsRule.hpp"

namespace czcheck {

namespace {

const char* const CHANGE_TYPES[] = {
    "build", "bump", "chore", "ci", "docs", "feat", "fix", "perf", "refactor", "revert", "style", "test",
};

}

std::optional<std::string> ConventionalCommitsRule::schemaPattern() const {
    std::string types;
    for (const char* t : CHANGE_TYPES) {
        if (!types.empty()) types += '|';
        types += t;
    }
    return std::string("(?s)")       // '.' spans lines
           + "(" + types + ")"       // type
           + "(\\(\\S+\\))?"         // scope
           + "!?"
           + ": "
           + "([^\\n\\r]+)"          // subject
           + "((\\n\\n.*)|(\\s*))?$";
}

std::optional<std::string> ConventionalCommitsRule::schema() const {
    return std::string(
        "<type>(<scope>): <subject>\n"
        "<BLANK LINE>\n"
        "<body>\n"
        "<BLANK LINE>\n"
        "(BREAKING CHANGE: )<footer>");
}

std::optional<std::string> ConventionalCommitsRule::example() const {
    return std::string(
        "fix: correct minor typos in code\n"
        "\n"
        "see the issue for details on the typos fixed\n"
        "\n"
        "closes issue #12");
}

std::optional<std::string> ConventionalCommitsRule::info() const {
    return std::string(
        "The commit message should be structured as follows:\n"
        "\n"
        "<type>[optional scope]: <description>\n"
        "\n"
        "[optional body]\n"
        "\n"
        "[optional footer]\n"
        "\n"
        "fix     a commit that patches a bug (PATCH in semantic versioning)\n"
        "feat    a commit that introduces a new feature (MINOR)\n"
        "BREAKING CHANGE: in the footer, or '!' after the type/scope,\n"
        "        introduces a breaking API change (MAJOR)\n"
        "\n"
        "Other types are allowed: build, bump, chore, ci, docs, perf,\n"
        "refactor, revert, style and test.");
}

}
