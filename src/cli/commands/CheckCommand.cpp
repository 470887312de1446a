#include "cli/commands/CheckCommand.hpp"

#include <stdexcept>

#include "cli/RuleSetLoader.hpp"
#include "core/CommitSource.hpp"

namespace czcheck {

namespace {

Error badArgument(const std::string& msg) {
    return Error{ErrorCode::InvalidCommandArgument, msg};
}

Expected<int> parseLimit(const std::string& text) {
    try {
        size_t used = 0;
        long long v = std::stoll(text, &used);
        if (used != text.size() || v < 0 || v > 1000000) {
            return badArgument("invalid value for --message-length-limit: '" + text + "'");
        }
        return static_cast<int>(v);
    } catch (const std::exception&) {
        return badArgument("invalid value for --message-length-limit: '" + text + "'");
    }
}

}  // namespace

Expected<CheckArguments> CheckCommand::parseArguments(const std::vector<std::string>& args) {
    CheckArguments parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inlineValue;
        // Accept --flag=value for long options
        if (flag.rfind("--", 0) == 0) {
            size_t eq = flag.find('=');
            if (eq != std::string::npos) {
                inlineValue = flag.substr(eq + 1);
                flag = flag.substr(0, eq);
            }
        }

        auto takeValue = [&](std::string& out) -> bool {
            if (inlineValue) {
                out = *inlineValue;
                return true;
            }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        std::string value;
        if (flag == "--commit-msg-file") {
            if (!takeValue(value)) return badArgument("--commit-msg-file requires a path");
            parsed.commitMsgFile = value;
        } else if (flag == "-m" || flag == "--message") {
            if (!takeValue(value)) return badArgument("--message requires a value");
            parsed.message = value;
        } else if (flag == "--rev-range") {
            if (!takeValue(value)) return badArgument("--rev-range requires a value");
            parsed.revRange = value;
        } else if (flag == "-a" || flag == "--allow-abort") {
            if (inlineValue) return badArgument("--allow-abort does not take a value");
            parsed.allowAbort = true;
        } else if (flag == "-l" || flag == "--message-length-limit") {
            if (!takeValue(value)) return badArgument("--message-length-limit requires a value");
            auto limit = parseLimit(value);
            if (!limit) return limit.error();
            parsed.messageLengthLimit = limit.value();
        } else if (flag == "--allowed-prefixes") {
            std::vector<std::string> prefixes;
            if (inlineValue) prefixes.push_back(*inlineValue);
            // Consume values up to the next option
            while (i + 1 < args.size() && args[i + 1].rfind("-", 0) != 0) {
                prefixes.push_back(args[++i]);
            }
            parsed.allowedPrefixes = prefixes;
        } else {
            return badArgument("unrecognized argument: " + args[i]);
        }
    }
    return parsed;
}

CheckConfiguration CheckCommand::makeConfiguration(const CheckArguments& args, const Settings& settings) {
    CheckConfiguration config;
    config.allowAbort = args.allowAbort || settings.allowAbort;
    config.maxMessageLength = args.messageLengthLimit ? *args.messageLengthLimit : settings.messageLengthLimit;
    config.allowedPrefixes = args.allowedPrefixes ? *args.allowedPrefixes : settings.allowedPrefixes;
    config.encoding = settings.encoding;
    return config;
}

/**
 * @brief Execute 'czcheck check'
 *
 * Argument errors are reported before configuration is read or any
 * commit is looked at.
 */
Expected<void> CheckCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseArguments(args);
    if (!parsed) return parsed.error();
    const CheckArguments& a = parsed.value();

    auto source = CommitSource::select(a.commitMsgFile, a.message, a.revRange, *ctx.input);
    if (!source) return source.error();

    auto settings = RuleSetLoader::loadSettings(ctx);
    if (!settings) return settings.error();

    auto rules = RuleSetLoader::loadRuleSet(ctx, settings.value());
    if (!rules) return rules.error();

    CheckEngine engine(makeConfiguration(a, settings.value()), *rules.value(), source.value(),
                       *ctx.gitLog, *ctx.output);
    return engine.run();
}

}
