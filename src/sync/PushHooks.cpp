#include "sync/PushHooks.hpp"

#include <algorithm>
#include <cctype>

#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace monosync {

HookChangeset HookChangeset::from(const std::string& repoName, const ChangesetId& id, const Changeset& cs) {
    HookChangeset hc;
    hc.repoName = repoName;
    hc.id = id;
    hc.author = cs.author;
    hc.comments = cs.message;
    hc.parents = cs.parents;
    for (const auto& [path, change] : cs.fileChanges) {
        hc.files.push_back(HookFile{path, change.isDeleted(), change.size});
    }
    return hc;
}

BlockedPathsHook::BlockedPathsHook(std::vector<std::string> patterns) : patterns(std::move(patterns)) {
    for (const auto& p : this->patterns) {
        compiled.push_back(PatternMatcher::globToRegex(p));
    }
}

Expected<HookExecution> BlockedPathsHook::run(const HookChangeset&, const HookFile& file) {
    if (file.deleted) return HookExecution::accept();
    for (size_t i = 0; i < compiled.size(); ++i) {
        if (std::regex_match(file.path, compiled[i])) {
            return HookExecution::reject(file.path + " is blocked",
                                         "path " + file.path + " matches blocked pattern " + patterns[i]);
        }
    }
    return HookExecution::accept();
}

Expected<HookExecution> MaxFileSizeHook::run(const HookChangeset&, const HookFile& file) {
    if (file.deleted || file.size <= limit) return HookExecution::accept();
    return HookExecution::reject(file.path + " is too large",
                                 file.path + " is " + std::to_string(file.size) + " bytes, limit is " +
                                     std::to_string(limit));
}

Expected<HookExecution> RequireMessageHook::run(const HookChangeset& changeset) {
    bool blank = std::all_of(changeset.comments.begin(), changeset.comments.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) return HookExecution::reject("empty commit message");
    return HookExecution::accept();
}

HookManager HookManager::fromConfig(const std::string& repoName, const HookConfig& config) {
    HookManager manager(repoName);
    if (!config.blockedPaths.empty()) {
        manager.addFileHook(std::make_unique<BlockedPathsHook>(config.blockedPaths));
    }
    if (config.maxFileSize > 0) {
        manager.addFileHook(std::make_unique<MaxFileSizeHook>(config.maxFileSize));
    }
    if (config.requireMessage) {
        manager.addChangesetHook(std::make_unique<RequireMessageHook>());
    }
    return manager;
}

Expected<void> HookManager::check(const std::vector<std::pair<ChangesetId, Changeset>>& changesets) {
    std::vector<std::string> rejections;
    auto note = [&](const char* hook, const ChangesetId& id, const HookExecution& exec) {
        if (exec.accepted) return;
        rejections.push_back(std::string(hook) + " " + id.shortHex() + ": " + exec.description);
        Logger::instance().debug(std::string(hook) + " rejected " + id.shortHex() + ": " +
                                 (exec.longDescription.empty() ? exec.description : exec.longDescription));
    };

    for (const auto& [id, cs] : changesets) {
        HookChangeset hc = HookChangeset::from(repoName, id, cs);
        for (auto& hook : changesetHooks) {
            auto exec = hook->run(hc);
            if (!exec) return exec.error();
            note(hook->name(), id, exec.value());
        }
        for (const auto& file : hc.files) {
            for (auto& hook : fileHooks) {
                auto exec = hook->run(hc, file);
                if (!exec) return exec.error();
                note(hook->name(), id, exec.value());
            }
        }
    }

    if (rejections.empty()) return {};
    Logger::instance().warn("push to " + repoName + " rejected by hooks (" + std::to_string(rejections.size()) +
                            " rejection(s))");
    return Error{ErrorCode::HookRejected, "push rejected by hooks", rejections};
}

}
