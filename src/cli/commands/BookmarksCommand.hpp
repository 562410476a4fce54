#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class BookmarksCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "bookmarks"; }
    const char* description() const override { return "List, create or delete bookmarks"; }
    const char* helpNameLine() const override { return "bookmarks -  Manage bookmarks"; }
    const char* helpSynopsis() const override {
        return "monosync bookmarks [-r <repo>] [<pattern>]\n"
               "       monosync bookmarks --create <name> <commit>\n"
               "       monosync bookmarks [-r <repo>] --delete <name>";
    }
    const char* helpDescription() const override {
        return "List bookmarks matching <pattern> ('*' stays within one path component, '**' crosses "
               "them, a plain name is a prefix). Small bookmarks are created and deleted together with "
               "their large counterparts.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-r <repo>", "Repository to use (default: the small repository)."},
            {"--create <name> <commit>", "Create a small bookmark at an already synced commit."},
            {"--delete <name>", "Delete a bookmark."},
        };
    }
};

}
