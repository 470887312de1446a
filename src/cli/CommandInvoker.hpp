#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace czcheck {

/**
 * @brief Runs a command and hands its failure message to the context's output
 *
 * The error is returned unchanged so the caller can pick the exit status.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
