#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class CheckCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "check"; }
    const char* description() const override { return "Verify repository consistency"; }
    const char* helpNameLine() const override { return "check -  Verify everything reachable from a commit"; }
    const char* helpSynopsis() const override {
        return "monosync check [-r <repo>] [--require-globalrevs] [--skip-contents] <commit>";
    }
    const char* helpDescription() const override {
        return "Re-hash and validate every commit reachable from <commit>, its generation numbers, file "
               "contents and identifier mappings. Every problem found is listed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-r <repo>", "Repository to check (default: the small repository)."},
            {"--require-globalrevs", "Report commits without a globalrev."},
            {"--skip-contents", "Do not read file contents."},
        };
    }
};

}
