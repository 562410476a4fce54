#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class CommitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "commit"; }
    const char* description() const override { return "Create a commit and push it to a bookmark"; }
    const char* helpNameLine() const override { return "commit -  Record changes on top of a bookmark"; }
    const char* helpSynopsis() const override {
        return "monosync commit [-r <repo>] [-b <bookmark>] -m <msg> [--author <name>] "
               "[--write <path> <file>]... [--delete <path>]... [--copy <from> <to>]... [--move <from> <to>]...";
    }
    const char* helpDescription() const override {
        return "Create a commit on top of the bookmark and push it. Pushes to the small repository are "
               "redirected through the large one and synced back; pushes to the large repository are "
               "pushrebased directly.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-r <repo>", "Repository to commit to (default: the small repository)."},
            {"-b <bookmark>", "Bookmark to push to (default: master)."},
            {"-m <msg>", "Use <msg> as the commit message; multiple -m concatenate paragraphs."},
            {"--author <name>", "Author of the commit (default: $USER)."},
            {"--write <path> <file>", "Set <path> to the contents of local <file>."},
            {"--delete <path>", "Delete <path>."},
            {"--copy <from> <to>", "Copy <from> to <to>, recording the copy source."},
            {"--move <from> <to>", "Move <from> to <to>, recording the copy source."},
        };
    }
};

}
