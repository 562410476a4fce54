#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace monosync {

/**
 * @brief Registry of CLI commands by name
 *
 * Commands are created fresh for every invocation. registerBuiltinCommands()
 * installs the monosync command set; tests may register extra creators.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);

    /// New command instance, or InvalidArgs for an unknown name
    Expected<std::unique_ptr<ICommand>> create(const std::string& name) const;

    /// One instance of every registered command, sorted by name
    void listCommands(std::vector<std::unique_ptr<ICommand>>& out) const;

    bool has(const std::string& name) const { return creators.count(name) > 0; }

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

/// Register help, init, commit, sync, lookup, diff, bookmarks, log and check
void registerBuiltinCommands(CommandFactory& factory);

}
