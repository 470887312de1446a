#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace czcheck {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().debug(std::string(cmd.name()) + " failed with " + toString(res.error().code));
        ctx.output->failure(res.error().message);
        return res;
    }
    return {};
}

}
