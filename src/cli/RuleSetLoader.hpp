#pragma once

#include <memory>

#include "cli/ICommand.hpp"
#include "core/Settings.hpp"
#include "rules/RulePlugin.hpp"
#include "util/Expected.hpp"

namespace czcheck {

/**
 * @brief Shared setup for commands that need configuration and a rule set
 */
namespace RuleSetLoader {

/// Load settings for ctx.cwd (or the current directory) and ctx.configPath
Expected<Settings> loadSettings(const AppContext& ctx);

/// Create the rule set named by ctx.ruleSetName, falling back to settings.name
Expected<std::unique_ptr<RulePlugin>> loadRuleSet(const AppContext& ctx, const Settings& settings);

}  // namespace RuleSetLoader

}  // namespace czcheck
