#pragma once

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/Constants.hpp"
#include "core/Repository.hpp"
#include "util/Expected.hpp"

namespace monosync {

struct PushrebaseParams {
    /// Publish attempts after the first before giving up with TooManyRetries
    int maxRetries{Constants::DEFAULT_PUSHREBASE_RETRIES};
};

struct PushrebaseOutcome {
    std::optional<ChangesetId> oldHead;   // bookmark value the publish replaced
    ChangesetId newHead;                  // bookmark value after the push
    /// (pushed id, published id) per pushed commit, ancestors first
    std::vector<std::pair<ChangesetId, ChangesetId>> rebased;
    int retries{0};
    /// False when the pushed commits were already reachable from the bookmark
    bool published{false};
};

/**
 * @brief Server-side rebase of a pushed batch onto a bookmark
 *
 * Per attempt:
 *   1. read the bookmark head H (fresh every attempt);
 *   2. check conflicts: a path touched by the batch (changed or used as a
 *      copy source) conflicts with a path changed by a commit reachable
 *      from H but not from the batch's base when the two are equal or one
 *      is a directory prefix of the other. Any conflict aborts the push
 *      with RebaseConflict naming the pushed paths; nothing is published;
 *   3. re-parent the batch on H in order, re-pointing parents and copy
 *      sources from the base to H and storing the new commits;
 *   4. compare-and-swap the bookmark from H to the rebased tip; if H moved,
 *      start over at 1, at most maxRetries more times.
 *
 * Degenerate cases: an absent bookmark is created at the pushed tip; a
 * bookmark at or behind the base is fast-forwarded without rebasing; a tip
 * already reachable from H publishes nothing. A batch without a base (its
 * oldest commit is a root) conflicts with every path in H's tree.
 *
 * Recording mappings for the rebased commits is the caller's job.
 */
class PushrebaseEngine {
public:
    PushrebaseEngine(Repository& repo, PushrebaseParams params) : repo(repo), params(params) {}

    /**
     * @brief Rebase and publish stored commits onto `bookmark`
     *
     * `commits` must already be in the repository and form a chain of
     * descendants of one base commit, with one tip. InvalidArgs otherwise.
     */
    Expected<PushrebaseOutcome> rebase(const std::string& bookmark, const std::vector<ChangesetId>& commits);

    /// Create a bookmark at an existing commit; false if it already exists
    Expected<bool> createBookmark(const std::string& name, const ChangesetId& target);

    /// Delete a bookmark if it still points at `expected`
    Expected<bool> deleteBookmark(const std::string& name, const ChangesetId& expected);

    /// Fast-forward a bookmark from `expected` to `target`; InvalidArgs for a non-fast-forward move
    Expected<bool> moveBookmark(const std::string& name, const ChangesetId& expected, const ChangesetId& target);

private:
    Repository& repo;
    PushrebaseParams params;

    struct Batch {
        std::vector<Changeset> commits;       // ancestors first
        std::vector<ChangesetId> ids;
        std::optional<ChangesetId> base;
        ChangesetId tip;
        std::set<std::string> touchedPaths;
    };

    Expected<Batch> loadBatch(const std::vector<ChangesetId>& commits) const;
    Expected<std::set<std::string>> serverPaths(const ChangesetId& head, const std::optional<ChangesetId>& base);
    Expected<std::vector<std::pair<ChangesetId, ChangesetId>>> rebaseOnto(const Batch& batch, const ChangesetId& head);
};

/// Pushed paths that collide with server paths (equal or directory prefix either way)
std::vector<std::string> conflictingPaths(const std::set<std::string>& pushed, const std::set<std::string>& server);

}
