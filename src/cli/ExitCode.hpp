#pragma once

#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Process exit statuses
 *
 * Values are stable so hooks and CI scripts can tell failure kinds apart.
 */
namespace ExitCode {
    constexpr int SUCCESS = 0;
    constexpr int NO_RULE_SET_FOUND = 1;
    constexpr int NO_COMMITS_FOUND = 3;
    constexpr int INVALID_COMMIT_MSG = 14;
    constexpr int MISSING_CUSTOMIZE_CONFIG = 15;
    constexpr int INVALID_COMMAND_ARGUMENT = 18;
    constexpr int INVALID_CONFIGURATION = 19;
    constexpr int UNRECOGNIZED_ENCODING = 22;
    constexpr int GIT_COMMAND_ERROR = 23;
    constexpr int CONFIG_FILE_NOT_FOUND = 30;
    constexpr int IO_ERROR = 31;
    constexpr int INTERNAL_ERROR = 1;

    /// Exit status for a command that failed with @p code
    int forError(ErrorCode code);
}

}
