#include "rules/RuleRegistry.hpp"

#include <algorithm>
#include <utility>

#include "rules/ConventionalCommitsRule.hpp"
#include "rules/CustomizeRule.hpp"
#include "rules/JiraSmartRule.hpp"
#include "util/Logger.hpp"

namespace czcheck {

RuleRegistry& RuleRegistry::instance() {
    static RuleRegistry r;
    return r;
}

void RuleRegistry::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

bool RuleRegistry::contains(const std::string& name) const {
    return creators.count(name) != 0;
}

Expected<std::unique_ptr<RulePlugin>> RuleRegistry::create(const std::string& name, const Settings& settings) const {
    auto it = creators.find(name);
    if (it == creators.end()) {
        return Error{ErrorCode::NoRuleSetFound,
                     "The rule set '" + name + "' has not been found in the system.\n"
                     "Run 'czcheck ls' to see the available rule sets."};
    }
    Logger::instance().debug("Using rule set: " + name);
    return it->second(settings);
}

std::vector<std::string> RuleRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void registerBuiltinRules(RuleRegistry& registry) {
    registry.registerCreator("cz_conventional_commits", [](const Settings& s) -> Expected<std::unique_ptr<RulePlugin>> {
        return std::unique_ptr<RulePlugin>(std::make_unique<ConventionalCommitsRule>(s));
    });
    registry.registerCreator("cz_jira", [](const Settings& s) -> Expected<std::unique_ptr<RulePlugin>> {
        return std::unique_ptr<RulePlugin>(std::make_unique<JiraSmartRule>(s));
    });
    registry.registerCreator("cz_customize", &CustomizeRule::create);
}

}
