#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/Settings.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Locates and reads the TOML configuration
 *
 * Settings live in a [tool.commitizen] table:
 *
 *   [tool.commitizen]
 *   name = "cz_conventional_commits"
 *   allow_abort = false
 *   allowed_prefixes = ["Merge", "Revert"]
 *   encoding = "utf-8"
 *   message_length_limit = 72
 *
 *   [tool.commitizen.customize]
 *   schema_pattern = "^(feat|fix): .+"
 *   schema = "<type>: <subject>"
 *   example = "feat: add login"
 *
 * Keys that are absent keep their defaults (see Settings).
 */
class Config {
public:
    /**
     * @brief Load settings for a working directory
     * @param cwd Directory to start searching from
     * @param explicitPath Config file given on the command line, if any
     * @return Merged settings, or ConfigFileNotFound / InvalidConfiguration
     *
     * Without an explicit path, each directory from @p cwd up to the
     * filesystem root is searched for Constants::CONFIG_FILES; the first
     * file that has a [tool.commitizen] table is used. If none is found
     * the defaults are returned.
     */
    static Expected<Settings> load(const std::filesystem::path& cwd,
                                   const std::optional<std::filesystem::path>& explicitPath = std::nullopt);

    /**
     * @brief Parse TOML text into settings
     * @param text TOML document
     * @param origin Name used in error messages
     * @return Settings (defaults if the document has no [tool.commitizen]
     *         table), or InvalidConfiguration
     */
    static Expected<Settings> parse(const std::string& text, const std::string& origin);

    /// True if the TOML document at @p path contains a [tool.commitizen] table
    static bool hasSettingsTable(const std::filesystem::path& path);
};

}
