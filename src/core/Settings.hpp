#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/Constants.hpp"

namespace czcheck {

/**
 * @brief Grammar supplied by the user for the cz_customize rule set
 *
 * Mirrors the [tool.commitizen.customize] table. An absent schemaPattern
 * disables structural checks for that rule set.
 */
struct CustomizeSettings {
    std::optional<std::string> schemaPattern;
    std::string schema;
    std::string example;
    std::string info;
};

/**
 * @brief Effective configuration after defaults and config file are merged
 */
struct Settings {
    std::string name{Constants::DEFAULT_RULE_SET};
    bool allowAbort{false};
    std::vector<std::string> allowedPrefixes{Constants::DEFAULT_ALLOWED_PREFIXES};
    std::string encoding{Constants::DEFAULT_ENCODING};
    int messageLengthLimit{0};
    std::optional<CustomizeSettings> customize;

    // File the values were read from; empty when only defaults apply
    std::filesystem::path source;
};

}
