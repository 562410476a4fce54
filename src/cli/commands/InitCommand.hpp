#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class InitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "init"; }
    const char* description() const override { return "Create a small/large repository pair"; }
    const char* helpNameLine() const override { return "init -  Create an empty synced repository pair"; }
    const char* helpSynopsis() const override { return "monosync init [--config <file>] [<directory>]"; }
    const char* helpDescription() const override {
        return "Create .monosync in <directory> (default: the current directory) holding an empty small "
               "repository, an empty large repository and the sync configuration between them.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--config <file>", "Use the sync configuration in <file> instead of the default one."} };
    }
};

}
