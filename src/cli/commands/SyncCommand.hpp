#pragma once

#include "cli/ICommand.hpp"

namespace monosync {

class SyncCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "sync"; }
    const char* description() const override { return "Sync a commit to the other repository"; }
    const char* helpNameLine() const override { return "sync -  Rewrite commits into the other repository"; }
    const char* helpSynopsis() const override {
        return "monosync sync [--to-large | --to-small] <commit>\n       monosync sync --recover <large-bookmark>";
    }
    const char* helpDescription() const override {
        return "Rewrite <commit> and its unsynced ancestors into the other repository under the current "
               "config version and record the mappings. --recover backsyncs a large bookmark so that "
               "mappings a crashed push left unrecorded are derived again.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--to-large", "<commit> names a small commit (default)."},
            {"--to-small", "<commit> names a large commit."},
            {"--recover <bookmark>", "Backsync everything reachable from a large bookmark."},
        };
    }
};

}
