#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace monosync {

class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /**
     * @brief Strip options that apply to every command
     *
     * Handles "--log-level <level>" anywhere before the command name and
     * returns the remaining arguments. InvalidArgs for an unknown level.
     */
    static Expected<std::vector<std::string>> applyGlobalOptions(const std::vector<std::string>& args);
};

}
