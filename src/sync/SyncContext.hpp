#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "core/BookmarkStore.hpp"
#include "core/Repository.hpp"
#include "sync/BookmarkRenamer.hpp"
#include "sync/CommitSyncConfig.hpp"
#include "sync/CommitSyncer.hpp"
#include "sync/PushRedirector.hpp"
#include "sync/SyncedCommitMapping.hpp"
#include "util/Expected.hpp"

namespace monosync {

/**
 * @brief Everything needed to sync one small/large repository pair
 *
 * On-disk layout:
 *   .monosync/
 *     config                   CommitSyncConfig (key: value)
 *     bookmarks/<repo-id>/...  one file per bookmark
 *     repos/<name>/objects/    blobstore of each repository
 *     repos/<name>/globalrevs  globalrev table
 *     repos/<name>/hg_mapping  hg id table
 *     synced_commit_mapping    small/large commit pairs
 */
class SyncContext {
public:
    SyncContext(std::unique_ptr<CommitSyncConfigStore> configs, std::shared_ptr<BookmarkStore> bookmarks,
                std::unique_ptr<Repository> small, std::unique_ptr<Repository> large,
                std::unique_ptr<SyncedCommitMapping> mapping);

    /// Both repositories, mapping and bookmarks in memory
    static Expected<std::unique_ptr<SyncContext>> inMemory(const CommitSyncConfig& config);

    /// Open the state under `root`/.monosync
    static Expected<std::unique_ptr<SyncContext>> openOnDisk(const std::filesystem::path& root);

    /// Create `root`/.monosync with the given config text; AlreadyInitialized if present
    static Expected<std::unique_ptr<SyncContext>> initOnDisk(const std::filesystem::path& root,
                                                             const std::string& configText);

    Repository& small() { return *smallRepo; }
    Repository& large() { return *largeRepo; }
    /// Repository by configured name; nullptr if unknown
    Repository* repo(const std::string& name);

    CommitSyncConfigStore& configs() { return *configStore; }
    SyncedCommitMapping& mapping() { return *syncedMapping; }
    BookmarkStore& bookmarks() { return *bookmarkStore; }
    CommitSyncer& syncer() { return *commitSyncer; }
    PushRedirector& redirector() { return *pushRedirector; }
    BookmarkRenamer renamer() const { return pushRedirector->renamer(); }

    PushrebaseParams pushrebaseParams() const;

private:
    std::unique_ptr<CommitSyncConfigStore> configStore;
    std::shared_ptr<BookmarkStore> bookmarkStore;
    std::unique_ptr<Repository> smallRepo;
    std::unique_ptr<Repository> largeRepo;
    std::unique_ptr<SyncedCommitMapping> syncedMapping;
    std::unique_ptr<CommitSyncer> commitSyncer;
    std::unique_ptr<PushRedirector> pushRedirector;
};

}
