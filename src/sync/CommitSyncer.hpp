#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/Repository.hpp"
#include "sync/CommitRewriter.hpp"
#include "sync/CommitSyncConfig.hpp"
#include "sync/SyncedCommitMapping.hpp"
#include "util/Expected.hpp"

namespace monosync {

struct SyncOutcome {
    /// Target commit standing in for the requested source commit. For a
    /// skipped commit this is its first substitute, nullopt if it has none.
    std::optional<ChangesetId> target;
    /// Newly recorded (source, target) pairs, ancestors first
    std::vector<std::pair<ChangesetId, ChangesetId>> synced;
    /// Commits skipped because nothing of them was in scope
    size_t skipped{0};
};

/**
 * @brief Syncs commits and their unsynced ancestors across the pair
 *
 * Unsynced ancestors are collected with an explicit stack and rewritten in
 * increasing generation order, which is a topological order, so history
 * depth never turns into call depth.
 *
 * Skipped commits get no mapping entry. Their descendants are parented on
 * the skipped commit's own substitutes instead; the decision is re-derived
 * (deterministically) whenever it is needed and memoized per process.
 *
 * Large to small only: when a large commit's back-reference names an
 * existing small commit whose parents equal the rewritten parents, that
 * small commit is reused instead of storing a rewritten copy. This is what
 * maps a pushed small commit to its pushrebased large counterpart, and what
 * lets a crash between publishing and recording be repaired by simply
 * syncing again.
 *
 * Always syncs under the current config version.
 */
class CommitSyncer {
public:
    CommitSyncer(Repository& small, Repository& large, SyncedCommitMapping& mapping,
                 const CommitSyncConfigStore& configs);

    /// Sync `sourceId` (and unsynced ancestors) in `direction`
    Expected<SyncOutcome> sync(Direction direction, const ChangesetId& sourceId);

    /**
     * @brief Re-derive mappings for everything reachable from a large bookmark
     *
     * Backsyncs the bookmark target. Returns the number of newly recorded
     * mappings (0 if the bookmark does not exist).
     */
    Expected<size_t> recover(const std::string& largeBookmark);

    /**
     * @brief Target commits standing in for a source commit
     *
     * One id for a mapped commit, the memoized substitutes for a skipped
     * one, nullopt if the commit has not been synced or skipped yet.
     */
    std::optional<std::vector<ChangesetId>> targetsOf(Direction direction, const ChangesetId& sourceId,
                                                      ConfigVersion version) const;

    const CommitRewriter& rewriter() const { return commitRewriter; }

    Repository& sourceRepo(Direction direction) { return direction == Direction::SmallToLarge ? small : large; }
    Repository& targetRepo(Direction direction) { return direction == Direction::SmallToLarge ? large : small; }

private:
    Repository& small;
    Repository& large;
    SyncedCommitMapping& mapping;
    const CommitSyncConfigStore& configs;
    CommitRewriter commitRewriter;

    // (direction, version, source id) -> substitutes of a skipped commit
    mutable std::mutex skipMtx;
    std::unordered_map<std::string, std::vector<ChangesetId>> skippedCommits;

    static std::string skipKey(Direction direction, ConfigVersion version, const ChangesetId& id);

    Expected<std::vector<ChangesetId>> collectUnsynced(Direction direction, const ChangesetId& sourceId,
                                                       ConfigVersion version);
    Expected<ChangesetId> storeRewritten(Direction direction, const Changeset& source, Changeset rewritten);
};

}
