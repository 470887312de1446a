#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Captured result of a finished child process
 */
struct ProcessResult {
    int exitCode{0};          // exit status, or -signal if killed by a signal
    std::string out;          // everything written to stdout
    std::string err;          // everything written to stderr
};

namespace Process {

/**
 * @brief Run a program to completion and capture its output
 *
 * The program is looked up on PATH and executed directly (no shell), so
 * arguments are never re-split or glob-expanded. Blocks until the child
 * exits.
 *
 * @param argv Program name followed by its arguments (must be non-empty)
 * @param workingDir Directory the child runs in (empty = inherit)
 * @return Result with exit code and output, or IoError if the process
 *         could not be started at all
 */
Expected<ProcessResult> run(const std::vector<std::string>& argv,
                            const std::filesystem::path& workingDir = {});

}  // namespace Process

}  // namespace czcheck
