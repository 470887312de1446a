#include "core/CommentFilter.hpp"

#include <utility>
#include <vector>

#include "core/Constants.hpp"

namespace czcheck {
namespace CommentFilter {

std::string filter(const std::string& message) {
    std::vector<std::string> kept;
    size_t start = 0;
    while (true) {
        size_t nl = message.find('\n', start);
        std::string line = message.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (line == Constants::VERBOSE_DIFF_DELIMITER) break;
        if (line.rfind('#', 0) != 0) kept.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }

    std::string out;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) out += '\n';
        out += kept[i];
    }
    return out;
}

}  // namespace CommentFilter
}  // namespace czcheck
