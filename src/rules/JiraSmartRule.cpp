#include "rules/JiraSmartRule.hpp"

namespace czcheck {

std::optional<std::string> JiraSmartRule::schemaPattern() const {
    return std::string(".*[A-Z]{2,}\\-[0-9]+( #| .* #).+( #.+)*");
}

std::optional<std::string> JiraSmartRule::schema() const {
    return std::string("<ignored text> <ISSUE_KEY> <ignored text> #<COMMAND> <optional COMMAND_ARGUMENTS>");
}

std::optional<std::string> JiraSmartRule::example() const {
    return std::string(
        "JRA-34 #comment corrected indent issue\n"
        "JRA-35 #time 1w 2d 4h 30m Total work logged\n"
        "JRA-123 JRA-234 JRA-345 #resolve");
}

std::optional<std::string> JiraSmartRule::info() const {
    return std::string(
        "Smart commits link a commit to Jira issues and run commands on them.\n"
        "Reference at least one issue key (e.g. JRA-34) followed by a command:\n"
        "\n"
        "  #comment <text>     add a comment to the issue\n"
        "  #time <duration>    log work against the issue\n"
        "  #<transition>       move the issue, e.g. #close or #resolve");
}

}
