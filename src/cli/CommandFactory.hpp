#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace czcheck {

/**
 * @brief Name -> command creator table behind the CLI dispatch
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    bool contains(const std::string& name) const;
    /// nullptr for unknown names
    std::unique_ptr<ICommand> create(const std::string& name) const;
    /// Fresh instance of every command, sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

/// Register every czcheck command with the factory
void registerCommands();

}
