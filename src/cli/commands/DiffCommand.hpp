#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class DiffCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "diff"; }
    const char* description() const override { return "Show changed paths"; }
    const char* helpNameLine() const override { return "diff -  Show paths changed between commits"; }
    const char* helpSynopsis() const override { return "monosync diff [-r <repo>] <commit> [<commit>]"; }
    const char* helpDescription() const override {
        return "With one commit, show what it changed relative to its first parent. With two, show "
               "what changed from the first to the second. Renames and copies are reported as such.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"-r <repo>", "Repository to read (default: the small repository)."} };
    }
};

}
