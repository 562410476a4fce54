#pragma once

#include <optional>
#include <unordered_map>
#include <vector>

#include "core/Changeset.hpp"
#include "sync/CommitSyncConfig.hpp"
#include "sync/PathRewriter.hpp"
#include "sync/SyncedCommitMapping.hpp"
#include "util/Expected.hpp"

namespace monosync {

/**
 * @brief Outcome of rewriting one commit
 *
 * Either the target-namespace changeset, or nothing when every file change
 * fell out of scope and the version's policy is to skip such commits.
 */
struct RewriteResult {
    std::optional<Changeset> changeset;

    bool skipped() const { return !changeset.has_value(); }
};

/**
 * @brief Parent substitutions for commits that have no mapping entry
 *
 * Source parent -> the target commits that stand in for it, in order. Used
 * for parents that were skipped (they stand in with their own mapped
 * parents, possibly none) and for parents rewritten earlier in the same
 * in-flight batch whose mapping is recorded only on publish.
 */
using ParentOverrides = std::unordered_map<ChangesetId, std::vector<ChangesetId>>;

/**
 * @brief Rewrites a commit into the other repository's namespace
 *
 * The rewritten commit has:
 *   - parents: the mapped id of each source parent, in order (duplicates
 *     produced by substitution are collapsed);
 *   - file changes: the source changes through PathRewriter, copy sources
 *     re-pointed at the mapped parent;
 *   - author, date, message: unchanged;
 *   - extras: the source extras minus any "sync.*" key, plus
 *     "sync.source-repo" and "sync.source-id" naming the source commit.
 *
 * Everything is a pure function of the source commit, the mapping of its
 * parents and the config version, so rewriting the same commit twice gives
 * byte-identical output and the same id.
 *
 * Fails with UnsyncedAncestor when a parent has neither a mapping entry for
 * the version nor an override. Nothing is stored; callers store the result.
 */
class CommitRewriter {
public:
    CommitRewriter(const SyncedCommitMapping& mapping, RepositoryId smallRepo, RepositoryId largeRepo)
        : mapping(mapping), smallRepo(smallRepo), largeRepo(largeRepo) {}

    Expected<RewriteResult> rewrite(const ChangesetId& sourceId, const Changeset& commit, Direction direction,
                                    const SyncVersionConfig& config,
                                    const ParentOverrides& overrides = {}) const;

    /// Mapping lookup for one commit in the given direction
    std::optional<ChangesetId> mapped(const ChangesetId& sourceId, Direction direction, ConfigVersion version) const;

    RepositoryId sourceRepo(Direction direction) const {
        return direction == Direction::SmallToLarge ? smallRepo : largeRepo;
    }
    RepositoryId targetRepo(Direction direction) const {
        return direction == Direction::SmallToLarge ? largeRepo : smallRepo;
    }

private:
    const SyncedCommitMapping& mapping;
    RepositoryId smallRepo;
    RepositoryId largeRepo;
};

/// Source commit named by a rewritten commit's back-reference, if any
std::optional<std::pair<RepositoryId, ChangesetId>> syncSourceOf(const Changeset& rewritten);

}
