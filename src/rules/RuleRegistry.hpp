#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Settings.hpp"
#include "rules/RulePlugin.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Name-keyed factory of rule sets
 *
 * The configured `name` setting selects which creator runs. Creators may
 * refuse settings they cannot work with (e.g. cz_customize without its
 * table) by returning an error.
 */
class RuleRegistry {
public:
    using Creator = std::function<Expected<std::unique_ptr<RulePlugin>>(const Settings&)>;

    static RuleRegistry& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;

    /**
     * @brief Instantiate the rule set called @p name
     * @return The rule set, NoRuleSetFound for unknown names, or the
     *         creator's own error
     */
    Expected<std::unique_ptr<RulePlugin>> create(const std::string& name, const Settings& settings) const;

    /// Registered names, sorted
    std::vector<std::string> names() const;

private:
    RuleRegistry() = default;
    std::unordered_map<std::string, Creator> creators;
};

/// Register cz_conventional_commits, cz_jira and cz_customize
void registerBuiltinRules(RuleRegistry& registry);

}
