#include "core/Config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <vector>

#define TOML_EXCEPTIONS 0
#include <toml++/toml.h>

#include "util/Logger.hpp"

namespace czcheck {

namespace fs = std::filesystem;

namespace {

Error invalid(const std::string& origin, const std::string& what) {
    return Error{ErrorCode::InvalidConfiguration, origin + ": " + what};
}

const toml::table* settingsTable(const toml::table& doc) {
    return doc["tool"]["commitizen"].as_table();
}

Expected<std::string> readText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read config file: " + path.string()};
    }
    return ss.str();
}

Expected<std::string> stringValue(const toml::node& node, const std::string& origin, const std::string& key) {
    auto v = node.value<std::string>();
    if (!v) return invalid(origin, "'" + key + "' must be a string");
    return *v;
}

Expected<void> applyCustomize(const toml::table& table, const std::string& origin, Settings& settings) {
    CustomizeSettings custom;
    if (const toml::node* n = table.get("schema_pattern")) {
        auto v = stringValue(*n, origin, "customize.schema_pattern");
        if (!v) return v.error();
        custom.schemaPattern = v.value();
    }
    struct Field { const char* key; std::string* target; };
    const Field fields[] = {
        {"schema", &custom.schema},
        {"example", &custom.example},
        {"info", &custom.info},
    };
    for (const auto& f : fields) {
        if (const toml::node* n = table.get(f.key)) {
            auto v = stringValue(*n, origin, std::string("customize.") + f.key);
            if (!v) return v.error();
            *f.target = v.value();
        }
    }
    settings.customize = custom;
    return {};
}

Expected<void> applyTable(const toml::table& table, const std::string& origin, Settings& settings) {
    if (const toml::node* n = table.get("name")) {
        auto v = stringValue(*n, origin, "name");
        if (!v) return v.error();
        settings.name = v.value();
    }
    if (const toml::node* n = table.get("allow_abort")) {
        auto v = n->value<bool>();
        if (!v) return invalid(origin, "'allow_abort' must be a boolean");
        settings.allowAbort = *v;
    }
    if (const toml::node* n = table.get("allowed_prefixes")) {
        const toml::array* arr = n->as_array();
        if (!arr) return invalid(origin, "'allowed_prefixes' must be an array of strings");
        std::vector<std::string> prefixes;
        for (const toml::node& el : *arr) {
            auto v = el.value<std::string>();
            if (!v) return invalid(origin, "'allowed_prefixes' must be an array of strings");
            prefixes.push_back(*v);
        }
        settings.allowedPrefixes = prefixes;
    }
    if (const toml::node* n = table.get("encoding")) {
        auto v = stringValue(*n, origin, "encoding");
        if (!v) return v.error();
        settings.encoding = v.value();
    }
    if (const toml::node* n = table.get("message_length_limit")) {
        auto v = n->value<int64_t>();
        if (!v || *v < 0) return invalid(origin, "'message_length_limit' must be a non-negative integer");
        settings.messageLengthLimit = static_cast<int>(*v);
    }
    if (const toml::node* n = table.get("customize")) {
        const toml::table* custom = n->as_table();
        if (!custom) return invalid(origin, "'customize' must be a table");
        auto res = applyCustomize(*custom, origin, settings);
        if (!res) return res;
    }
    return {};
}

}  // namespace

Expected<Settings> Config::parse(const std::string& text, const std::string& origin) {
    toml::parse_result r = toml::parse(text, origin);
    if (!r) {
        std::ostringstream msg;
        msg << "invalid TOML: " << r.error().description() << " (line " << r.error().source().begin.line << ")";
        return invalid(origin, msg.str());
    }
    const toml::table& doc = r.table();

    Settings settings;
    const toml::table* table = settingsTable(doc);
    if (!table) return settings;

    auto res = applyTable(*table, origin, settings);
    if (!res) return res.error();
    return settings;
}

bool Config::hasSettingsTable(const fs::path& path) {
    auto text = readText(path);
    if (!text) return false;
    toml::parse_result r = toml::parse(text.value(), path.string());
    if (!r) {
        Logger::instance().warn("Skipping unparsable config " + path.string() + ": " +
                                std::string(r.error().description()));
        return false;
    }
    return settingsTable(r.table()) != nullptr;
}

Expected<Settings> Config::load(const fs::path& cwd, const std::optional<fs::path>& explicitPath) {
    fs::path chosen;
    if (explicitPath) {
        std::error_code ec;
        if (!fs::is_regular_file(*explicitPath, ec)) {
            return Error{ErrorCode::ConfigFileNotFound, "Config file not found: " + explicitPath->string()};
        }
        chosen = *explicitPath;
    } else {
        std::error_code ec;
        fs::path dir = fs::absolute(cwd, ec);
        if (ec) dir = cwd;
        while (chosen.empty()) {
            for (const auto& name : Constants::CONFIG_FILES) {
                fs::path candidate = dir / name;
                if (fs::is_regular_file(candidate, ec) && hasSettingsTable(candidate)) {
                    chosen = candidate;
                    break;
                }
            }
            if (!chosen.empty() || !dir.has_parent_path() || dir.parent_path() == dir) break;
            dir = dir.parent_path();
        }
    }

    if (chosen.empty()) {
        Logger::instance().debug("No config file found, using defaults");
        return Settings{};
    }

    Logger::instance().debug("Using config file: " + chosen.string());
    auto text = readText(chosen);
    if (!text) return text.error();
    auto settings = parse(text.value(), chosen.string());
    if (!settings) return settings.error();
    settings.value().source = chosen;
    return settings;
}

}
