#pragma once

#include <string>

namespace czcheck {

/**
 * @brief Removes editor comments from a hand-written commit message
 *
 * Lines starting with '#' are dropped. When `git commit --verbose` is used
 * the message file also holds the staged diff below a scissors line:
 *
 *   # ------------------------ >8 ------------------------
 *   # Do not modify or remove the line above.
 *   # Everything below it will be ignored.
 *   diff --git a/... b/...
 *
 * Everything from that line on is discarded. Messages read from git
 * history are never passed through this filter.
 */
namespace CommentFilter {

std::string filter(const std::string& message);

}  // namespace CommentFilter

}  // namespace czcheck
