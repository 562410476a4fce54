#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Repository.hpp"
#include "sync/BookmarkRenamer.hpp"
#include "sync/CommitSyncer.hpp"
#include "sync/Pushrebase.hpp"
#include "util/Expected.hpp"

namespace monosync {

struct PushedCommit {
    ChangesetId smallPushed;                 // as pushed by the client
    ChangesetId large;                       // as published in the large repository
    std::optional<ChangesetId> smallLanded;  // small commit mapped to `large`
    std::optional<uint64_t> globalrev;
};

struct PushResult {
    std::string smallBookmark;
    std::string largeBookmark;
    ChangesetId smallHead;
    ChangesetId largeHead;
    std::vector<PushedCommit> commits;
    /// Commits newly published on the large bookmark by this push
    size_t published{0};
    int retries{0};
};

/**
 * @brief Routes pushes to the small repository through the large one
 *
 * push():
 *   1. store the pushed small commits (ancestors first);
 *   2. re-derive any mapping a previous crash left unrecorded;
 *   3. run the configured push hooks over the commits that are not synced
 *      yet; a rejection fails the push before the large repository changes;
 *   4. rewrite the commits that are not synced yet into the large
 *      namespace, parenting later commits on earlier rewrites;
 *   5. pushrebase them onto the large bookmark (BookmarkRenamer::toLarge);
 *   6. backsync the new large head, which records the mappings and reuses
 *      the pushed small commits whose parents did not change;
 *   7. move the small bookmark to the backsynced head by compare-and-swap;
 *   8. assign globalrevs and hg ids to the newly published large commits.
 *
 * The large bookmark is the source of truth: when step 7 loses a race the
 * small bookmark is only ever moved forward.
 */
class PushRedirector {
public:
    PushRedirector(Repository& small, Repository& large, CommitSyncer& syncer,
                   const CommitSyncConfigStore& configs);

    /// Store and push changesets to `smallBookmark`
    Expected<PushResult> push(const std::string& smallBookmark, const std::vector<Changeset>& commits);

    /// Push commits already stored in the small repository
    Expected<PushResult> pushStored(const std::string& smallBookmark, const std::vector<ChangesetId>& commits);

    /// Create a small bookmark (and its large counterpart) at an already synced commit
    Expected<void> createBookmark(const std::string& smallBookmark, const ChangesetId& smallTarget);

    /// Delete a small bookmark and its large counterpart; NotFound if the small bookmark does not exist
    Expected<void> deleteBookmark(const std::string& smallBookmark);

    BookmarkRenamer renamer() const;

private:
    Repository& small;
    Repository& large;
    CommitSyncer& syncer;
    const CommitSyncConfigStore& configs;

    int maxRetries() const;
    /// (small id, stored large rewrite) for every pushed commit that was not skipped
    Expected<std::vector<std::pair<ChangesetId, ChangesetId>>> rewriteBatch(const std::vector<ChangesetId>& pending,
                                                                            const SyncVersionConfig& config);
    /// HookRejected unless every configured hook accepts the unsynced commits
    Expected<void> runHooks(const std::vector<ChangesetId>& pending);
    Expected<void> advanceSmallBookmark(const std::string& name, const std::optional<ChangesetId>& observed,
                                        const ChangesetId& target);
};

}
