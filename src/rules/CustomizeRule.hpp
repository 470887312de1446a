#pragma once

#include <memory>

#include "rules/RulePlugin.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Convention defined in the [tool.commitizen.customize] table
 *
 * Without a schema_pattern key no structure is enforced and only empty
 * messages are rejected.
 */
class CustomizeRule : public RulePlugin {
    // Restricts construction to create()
    struct Key {
        explicit Key() = default;
    };

public:
    /// Fails with MissingCustomizeConfig when @p settings has no customize table
    static Expected<std::unique_ptr<RulePlugin>> create(const Settings& settings);

    CustomizeRule(Key, Settings settings, CustomizeSettings custom);

    const char* name() const override { return "cz_customize"; }
    std::optional<std::string> schemaPattern() const override;
    std::optional<std::string> schema() const override;
    std::optional<std::string> example() const override;
    std::optional<std::string> info() const override;

private:
    CustomizeSettings custom;
};

}
