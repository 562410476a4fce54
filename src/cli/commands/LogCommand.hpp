#pragma once

#include <cstdint>
#include <string>

#include "cli/ICommand.hpp"

namespace monosync {

/// "+HHMM" / "-HHMM" for an offset in seconds east of UTC; hours widen past 99
std::string formatTimezone(int32_t offsetSeconds);

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Show commit logs"; }
    const char* helpNameLine() const override { return "log -  Show commit logs"; }
    const char* helpSynopsis() const override { return "monosync log [-r <repo>] [-n <count>] [<commit>]"; }
    const char* helpDescription() const override {
        return "Show the first-parent history of <commit> (default: master), newest first.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-r <repo>", "Repository to read (default: the small repository)."},
            {"-n <count>", "Show at most <count> commits (default: 10)."},
        };
    }
};

}
