#include "cli/commands/InitCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/Constants.hpp"
#include "sync/SyncContext.hpp"

namespace monosync {

namespace {

/// Small repo "small" embedded under small/ in large repo "large", master shared
CommitSyncConfig defaultConfig() {
    CommitSyncConfig config;
    config.smallRepo = SyncRepo{1, "small"};
    config.largeRepo = SyncRepo{0, "large"};
    config.bookmarkPrefix = "small";
    config.maxPushrebaseRetries = Constants::DEFAULT_PUSHREBASE_RETRIES;
    SyncVersionConfig v;
    v.version = 1;
    v.smallRepoPrefix = "small";
    v.commonBookmarks = {"master"};
    v.emptyCommits = EmptyCommitPolicy::Skip;
    config.versions[v.version] = v;
    return config;
}

}

Expected<void> InitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto configFile = takeOption(rest, "--config");
    if (!configFile) return configFile.error();
    if (rest.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "init takes at most one directory"};
    }

    std::filesystem::path target = workDirOf(ctx);
    if (!rest.empty()) {
        target = std::filesystem::path(rest.front());
        if (target.is_relative()) target = workDirOf(ctx) / target;
    }

    std::string configText = defaultConfig().serialize();
    if (!configFile.value().empty()) {
        auto text = readLocalFile(configFile.value());
        if (!text) return text.error();
        configText = text.value();
    }

    std::string stateDir = std::filesystem::absolute(target).lexically_normal().string() + "/" +
                           Constants::STATE_DIR + "/";
    auto res = SyncContext::initOnDisk(target, configText);
    if (!res) {
        if (res.error().code == ErrorCode::AlreadyInitialized) {
            std::cout << "monosync repository pair is already initialised in " << stateDir << "\n";
            return {};
        }
        return res.error();
    }
    std::cout << "Initialized empty monosync repository pair ("
              << res.value()->small().name() << " -> " << res.value()->large().name() << ") in "
              << stateDir << "\n";
    return {};
}

}
