#include "cli/ExitCode.hpp"

namespace czcheck {
namespace ExitCode {

int forError(ErrorCode code) {
    switch (code) {
    case ErrorCode::None: return SUCCESS;
    case ErrorCode::NoRuleSetFound: return NO_RULE_SET_FOUND;
    case ErrorCode::NoCommitsFound: return NO_COMMITS_FOUND;
    case ErrorCode::InvalidCommitMessage: return INVALID_COMMIT_MSG;
    case ErrorCode::MissingCustomizeConfig: return MISSING_CUSTOMIZE_CONFIG;
    case ErrorCode::InvalidCommandArgument: return INVALID_COMMAND_ARGUMENT;
    case ErrorCode::InvalidConfiguration: return INVALID_CONFIGURATION;
    case ErrorCode::UnrecognizedEncoding: return UNRECOGNIZED_ENCODING;
    case ErrorCode::GitCommandError: return GIT_COMMAND_ERROR;
    case ErrorCode::ConfigFileNotFound: return CONFIG_FILE_NOT_FOUND;
    case ErrorCode::IoError: return IO_ERROR;
    case ErrorCode::InternalError: return INTERNAL_ERROR;
    }
    return INTERNAL_ERROR;
}

}  // namespace ExitCode
}  // namespace czcheck
