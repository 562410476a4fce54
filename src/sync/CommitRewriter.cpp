#include "sync/CommitRewriter.hpp"

#include <algorithm>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace monosync {

std::optional<ChangesetId> CommitRewriter::mapped(const ChangesetId& sourceId, Direction direction,
                                                  ConfigVersion version) const {
    if (direction == Direction::SmallToLarge) {
        return mapping.getLarge(smallRepo, largeRepo, version, sourceId);
    }
    return mapping.getSmall(smallRepo, largeRepo, version, sourceId);
}

Expected<RewriteResult> CommitRewriter::rewrite(const ChangesetId& sourceId, const Changeset& commit,
                                                Direction direction, const SyncVersionConfig& config,
                                                const ParentOverrides& overrides) const {
    // Source parent -> first target commit standing in for it (for copy sources)
    std::unordered_map<ChangesetId, std::optional<ChangesetId>> parentTarget;
    std::vector<ChangesetId> parents;
    for (const auto& p : commit.parents) {
        std::vector<ChangesetId> targets;
        auto over = overrides.find(p);
        if (over != overrides.end()) {
            targets = over->second;
        } else if (auto m = mapped(p, direction, config.version)) {
            targets.push_back(*m);
        } else {
            return Error{ErrorCode::UnsyncedAncestor, "parent has not been synced",
                         {"commit " + sourceId.hex(), "parent " + p.hex(), "version " + std::to_string(config.version),
                          directionName(direction)}};
        }
        parentTarget[p] = targets.empty() ? std::nullopt : std::optional<ChangesetId>(targets.front());
        for (const auto& t : targets) {
            if (std::find(parents.begin(), parents.end(), t) == parents.end()) parents.push_back(t);
        }
    }

    auto changes = PathRewriter::rewriteFileChanges(commit.fileChanges, direction, config);
    for (auto& [path, change] : changes) {
        if (!change.copyFrom) continue;
        auto it = parentTarget.find(change.copyFrom->changeset);
        if (it == parentTarget.end() || !it->second) {
            change.copyFrom.reset();
        } else {
            change.copyFrom->changeset = *it->second;
        }
    }

    if (changes.empty() && !commit.fileChanges.empty() && config.emptyCommits == EmptyCommitPolicy::Skip) {
        Logger::instance().info("skipping " + sourceId.shortHex() + " (" + directionName(direction) +
                                "): no file changes in scope");
        return RewriteResult{};
    }

    Changeset out;
    out.parents = std::move(parents);
    out.fileChanges = std::move(changes);
    out.author = commit.author;
    out.authorTimestamp = commit.authorTimestamp;
    out.authorTzOffset = commit.authorTzOffset;
    out.message = commit.message;
    for (const auto& [k, v] : commit.extras) {
        if (k.compare(0, std::string(Constants::EXTRA_SYNC_PREFIX).size(), Constants::EXTRA_SYNC_PREFIX) == 0) continue;
        out.extras[k] = v;
    }
    out.extras[Constants::EXTRA_SYNC_SOURCE_REPO] = std::to_string(sourceRepo(direction));
    out.extras[Constants::EXTRA_SYNC_SOURCE_ID] = sourceId.hex();

    Logger::instance().debug("rewrote " + sourceId.shortHex() + " (" + directionName(direction) + ") to " +
                             out.computeId().shortHex());
    return RewriteResult{std::move(out)};
}

std::optional<std::pair<RepositoryId, ChangesetId>> syncSourceOf(const Changeset& rewritten) {
    auto repo = rewritten.extra(Constants::EXTRA_SYNC_SOURCE_REPO);
    auto id = rewritten.extra(Constants::EXTRA_SYNC_SOURCE_ID);
    if (!repo || !id) return std::nullopt;
    auto parsedId = ChangesetId::fromHex(*id);
    if (!parsedId) return std::nullopt;
    try {
        return std::make_pair(static_cast<RepositoryId>(std::stol(*repo)), *parsedId);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
