#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class LookupCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "lookup"; }
    const char* description() const override { return "Translate commit identifiers"; }
    const char* helpNameLine() const override { return "lookup -  Show every identifier of a commit"; }
    const char* helpSynopsis() const override { return "monosync lookup [-r <repo>] [--kind <kind>]... <commit>"; }
    const char* helpDescription() const override {
        return "Resolve <commit> (native id, hg id, globalrev or bookmark) and print its identifiers, "
               "followed by the commit it is synced with in the other repository.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-r <repo>", "Repository to look in (default: the small repository)."},
            {"--kind <kind>", "Only print bonsai, hg, globalrev or bookmark; may be repeated."},
        };
    }
};

}
