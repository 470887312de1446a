#include "cli/RuleSetLoader.hpp"

#include <filesystem>

#include "core/Config.hpp"
#include "rules/RuleRegistry.hpp"

namespace czcheck {
namespace RuleSetLoader {

Expected<Settings> loadSettings(const AppContext& ctx) {
    std::filesystem::path cwd = ctx.cwd.empty() ? std::filesystem::current_path() : ctx.cwd;
    return Config::load(cwd, ctx.configPath);
}

Expected<std::unique_ptr<RulePlugin>> loadRuleSet(const AppContext& ctx, const Settings& settings) {
    const std::string& name = ctx.ruleSetName ? *ctx.ruleSetName : settings.name;
    return RuleRegistry::instance().create(name, settings);
}

}  // namespace RuleSetLoader
}  // namespace czcheck
