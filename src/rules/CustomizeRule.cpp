#include "rules/CustomizeRule.hpp"

#include <memory>
#include <utility>

namespace czcheck {

namespace {

std::optional<std::string> nonEmpty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

}

CustomizeRule::CustomizeRule(Key, Settings settings, CustomizeSettings custom)
    : RulePlugin(std::move(settings)), custom(std::move(custom)) {}

Expected<std::unique_ptr<RulePlugin>> CustomizeRule::create(const Settings& settings) {
    if (!settings.customize) {
        return Error{ErrorCode::MissingCustomizeConfig,
                     "cz_customize requires a [tool.commitizen.customize] section in the config file"};
    }
    return std::unique_ptr<RulePlugin>(std::make_unique<CustomizeRule>(Key{}, settings, *settings.customize));
}

std::optional<std::string> CustomizeRule::schemaPattern() const { return custom.schemaPattern; }
std::optional<std::string> CustomizeRule::schema() const { return nonEmpty(custom.schema); }
std::optional<std::string> CustomizeRule::example() const { return nonEmpty(custom.example); }
std::optional<std::string> CustomizeRule::info() const { return nonEmpty(custom.info); }

}
