#pragma once

#include "cli/ICommand.hpp"

namespace czcheck {

/**
 * @brief `schema`, `example` and `info`: print a description of the active rule set
 */
class DescribeCommand : public ICommand {
public:
    enum class Topic { Schema, Example, Info };

    explicit DescribeCommand(Topic topic) : topic(topic) {}

    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override;
    const char* description() const override;
    const char* helpNameLine() const override;
    const char* helpSynopsis() const override;
    const char* helpDescription() const override;
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }

private:
    Topic topic;
};

}
