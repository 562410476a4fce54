#include "sync/PushRedirector.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "sync/PushHooks.hpp"
#include "util/Logger.hpp"

namespace monosync {

PushRedirector::PushRedirector(Repository& small, Repository& large, CommitSyncer& syncer,
                               const CommitSyncConfigStore& configs)
    : small(small), large(large), syncer(syncer), configs(configs) {}

BookmarkRenamer PushRedirector::renamer() const {
    CommitSyncConfig config = configs.snapshot();
    return BookmarkRenamer(config.bookmarkPrefix, config.current());
}

int PushRedirector::maxRetries() const {
    return configs.snapshot().maxPushrebaseRetries;
}

Expected<PushResult> PushRedirector::push(const std::string& smallBookmark, const std::vector<Changeset>& commits) {
    std::vector<ChangesetId> ids;
    ids.reserve(commits.size());
    for (const auto& cs : commits) {
        auto id = small.changesets().put(cs);
        if (!id) return id.error();
        ids.push_back(id.value());
    }
    return pushStored(smallBookmark, ids);
}

Expected<std::vector<std::pair<ChangesetId, ChangesetId>>> PushRedirector::rewriteBatch(
    const std::vector<ChangesetId>& pending, const SyncVersionConfig& config) {
    ParentOverrides overrides;
    std::vector<std::pair<ChangesetId, ChangesetId>> rewritten;
    for (const auto& id : pending) {
        auto cs = small.changesets().get(id);
        if (!cs) return cs.error();

        auto result = syncer.rewriter().rewrite(id, cs.value(), Direction::SmallToLarge, config, overrides);
        if (!result) return result.error();
        if (result.value().skipped()) {
            // Stand in with the parents' substitutes, as CommitSyncer does
            std::vector<ChangesetId> substitutes;
            for (const auto& p : cs.value().parents) {
                auto over = overrides.find(p);
                std::vector<ChangesetId> targets;
                if (over != overrides.end()) {
                    targets = over->second;
                } else if (auto m = syncer.rewriter().mapped(p, Direction::SmallToLarge, config.version)) {
                    targets.push_back(*m);
                }
                for (const auto& t : targets) {
                    if (std::find(substitutes.begin(), substitutes.end(), t) == substitutes.end()) {
                        substitutes.push_back(t);
                    }
                }
            }
            overrides[id] = substitutes;
            continue;
        }

        auto imported = large.changesets().importContents(small.changesets(), *result.value().changeset);
        if (!imported) return imported.error();
        auto stored = large.changesets().put(*result.value().changeset);
        if (!stored) return stored.error();
        overrides[id] = {stored.value()};
        rewritten.emplace_back(id, stored.value());
    }
    return rewritten;
}

Expected<void> PushRedirector::runHooks(const std::vector<ChangesetId>& pending) {
    CommitSyncConfig snapshot = configs.snapshot();
    if (snapshot.hooks.empty()) return {};
    HookManager hooks = HookManager::fromConfig(snapshot.smallRepo.name, snapshot.hooks);

    std::vector<std::pair<ChangesetId, Changeset>> changesets;
    for (const auto& id : pending) {
        auto cs = small.changesets().get(id);
        if (!cs) return cs.error();
        changesets.emplace_back(id, cs.value());
    }
    return hooks.check(changesets);
}

Expected<void> PushRedirector::advanceSmallBookmark(const std::string& name,
                                                    const std::optional<ChangesetId>& observed,
                                                    const ChangesetId& target) {
    std::optional<ChangesetId> expected = observed;
    for (int attempt = 0; attempt <= maxRetries(); ++attempt) {
        if (expected && *expected == target) return {};
        if (expected) {
            // Never move backwards over a concurrent push that already covers ours
            auto covered = small.changesets().isAncestor(target, *expected);
            if (!covered) return covered.error();
            if (covered.value()) return {};
        }
        auto swapped = small.bookmarks().compareAndSwap(small.id(), name, expected, target);
        if (!swapped) return swapped.error();
        if (swapped.value()) return {};

        auto current = small.bookmark(name);
        if (!current) return current.error();
        expected = current.value();
    }
    return Error{ErrorCode::TooManyRetries, "small bookmark " + name + " kept moving", {target.hex()}};
}

Expected<PushResult> PushRedirector::pushStored(const std::string& smallBookmark,
                                                const std::vector<ChangesetId>& commits) {
    if (commits.empty()) {
        return Error{ErrorCode::InvalidArgs, "nothing to push"};
    }
    if (!isValidBookmarkName(smallBookmark)) {
        return Error{ErrorCode::InvalidArgs, "invalid bookmark name", {smallBookmark}};
    }
    SyncVersionConfig config = configs.current();
    BookmarkRenamer names = renamer();

    PushResult result;
    result.smallBookmark = smallBookmark;
    result.largeBookmark = names.toLarge(smallBookmark);

    auto smallObserved = small.bookmark(smallBookmark);
    if (!smallObserved) return smallObserved.error();

    auto recovered = syncer.recover(result.largeBookmark);
    if (!recovered) return recovered.error();
    if (recovered.value() > 0) {
        Logger::instance().warn("recovered " + std::to_string(recovered.value()) + " unrecorded mapping(s) on " +
                                result.largeBookmark);
    }

    // Pushed commits in generation order; the synced ones are already landed
    std::vector<std::pair<uint64_t, ChangesetId>> ordered;
    std::unordered_set<ChangesetId> seen;
    for (const auto& id : commits) {
        if (!seen.insert(id).second) continue;
        auto gen = small.changesets().generation(id);
        if (!gen) return gen.error();
        ordered.emplace_back(gen.value(), id);
    }
    std::sort(ordered.begin(), ordered.end());
    ChangesetId pushedTip = ordered.back().second;

    std::vector<ChangesetId> pending;
    for (const auto& entry : ordered) {
        if (!syncer.rewriter().mapped(entry.second, Direction::SmallToLarge, config.version)) {
            pending.push_back(entry.second);
        }
    }

    ChangesetId largeTip;
    // Pushed small commit -> large commit newly published for it
    std::unordered_map<ChangesetId, ChangesetId> published;
    if (!pending.empty()) {
        auto checked = runHooks(pending);
        if (!checked) return checked.error();

        auto rewritten = rewriteBatch(pending, config);
        if (!rewritten) return rewritten.error();
        if (rewritten.value().empty()) {
            return Error{ErrorCode::InvalidArgs, "no pushed commit has changes for the large repository"};
        }
        std::vector<ChangesetId> batch;
        for (const auto& entry : rewritten.value()) batch.push_back(entry.second);

        PushrebaseEngine engine(large, PushrebaseParams{maxRetries()});
        auto outcome = engine.rebase(result.largeBookmark, batch);
        if (!outcome) return outcome.error();
        largeTip = outcome.value().newHead;
        result.retries = outcome.value().retries;
        if (outcome.value().published) {
            std::unordered_map<ChangesetId, ChangesetId> rebased(outcome.value().rebased.begin(),
                                                                 outcome.value().rebased.end());
            for (const auto& [smallId, rewrittenId] : rewritten.value()) {
                auto it = rebased.find(rewrittenId);
                if (it != rebased.end()) published[smallId] = it->second;
            }
        }
    } else {
        auto mappedTip = syncer.rewriter().mapped(pushedTip, Direction::SmallToLarge, config.version);
        if (!mappedTip) {
            return Error{ErrorCode::InternalError, "landed commit lost its mapping", {pushedTip.hex()}};
        }
        largeTip = *mappedTip;
    }

    auto back = syncer.sync(Direction::LargeToSmall, largeTip);
    if (!back) return back.error();
    if (!back.value().target) {
        return Error{ErrorCode::InternalError, "published head has no small counterpart", {largeTip.hex()}};
    }
    result.largeHead = largeTip;
    result.smallHead = *back.value().target;

    auto moved = advanceSmallBookmark(smallBookmark, smallObserved.value(), result.smallHead);
    if (!moved) return moved.error();

    // Report per pushed commit, and number the newly published large commits
    std::vector<ChangesetId> newLarge;
    for (const auto& entry : ordered) {
        const ChangesetId& smallId = entry.second;
        std::optional<ChangesetId> largeId;
        auto pub = published.find(smallId);
        if (pub != published.end()) {
            largeId = pub->second;
            newLarge.push_back(*largeId);
        } else {
            largeId = syncer.rewriter().mapped(smallId, Direction::SmallToLarge, config.version);
        }
        if (!largeId) continue;

        PushedCommit pc;
        pc.smallPushed = smallId;
        pc.large = *largeId;
        pc.smallLanded = syncer.rewriter().mapped(*largeId, Direction::LargeToSmall, config.version);
        result.commits.push_back(pc);
    }

    for (const auto& id : newLarge) {
        auto rev = large.globalrevs().assign(id);
        if (!rev) return rev.error();
        auto hg = large.hgIdOf(id);
        if (!hg) return hg.error();
    }
    for (auto& pc : result.commits) {
        pc.globalrev = large.globalrevs().get(pc.large);
    }
    result.published = newLarge.size();

    Logger::instance().info("push to " + smallBookmark + ": " + std::to_string(result.published) +
                            " commit(s) published on " + result.largeBookmark + " at " + result.largeHead.shortHex());
    return result;
}

Expected<void> PushRedirector::createBookmark(const std::string& smallBookmark, const ChangesetId& smallTarget) {
    SyncVersionConfig config = configs.current();
    std::string largeName = renamer().toLarge(smallBookmark);

    auto largeTarget = syncer.rewriter().mapped(smallTarget, Direction::SmallToLarge, config.version);
    if (!largeTarget) {
        return Error{ErrorCode::UnsyncedAncestor, "bookmark target has not been synced", {smallTarget.hex()}};
    }

    auto existing = small.bookmark(smallBookmark);
    if (!existing) return existing.error();
    if (existing.value()) {
        return Error{ErrorCode::InvalidArgs, "bookmark already exists", {smallBookmark}};
    }

    PushrebaseEngine engine(large, PushrebaseParams{maxRetries()});
    auto created = engine.createBookmark(largeName, *largeTarget);
    if (!created) return created.error();
    if (!created.value()) {
        return Error{ErrorCode::InvalidArgs, "bookmark already exists", {largeName}};
    }

    auto smallCreated = small.bookmarks().compareAndSwap(small.id(), smallBookmark, std::nullopt, smallTarget);
    if (smallCreated && smallCreated.value()) return {};

    // Lost the small side (or failed to write it): take the large bookmark back
    auto undone = engine.deleteBookmark(largeName, *largeTarget);
    if (!undone) return undone.error();
    if (!undone.value()) {
        Logger::instance().warn("could not remove " + largeName + " after failing to create " + smallBookmark +
                                "; it moved in the meantime");
    }
    if (!smallCreated) return smallCreated.error();
    return Error{ErrorCode::InvalidArgs, "bookmark already exists", {smallBookmark}};
}

Expected<void> PushRedirector::deleteBookmark(const std::string& smallBookmark) {
    std::string largeName = renamer().toLarge(smallBookmark);
    PushrebaseEngine engine(large, PushrebaseParams{maxRetries()});

    for (int attempt = 0; attempt <= maxRetries(); ++attempt) {
        auto smallValue = small.bookmark(smallBookmark);
        if (!smallValue) return smallValue.error();
        if (!smallValue.value()) {
            return Error{ErrorCode::NotFound, "no such bookmark", {smallBookmark}};
        }

        auto largeValue = large.bookmark(largeName);
        if (!largeValue) return largeValue.error();
        if (largeValue.value()) {
            auto removed = engine.deleteBookmark(largeName, *largeValue.value());
            if (!removed) return removed.error();
            if (!removed.value()) continue;
        }

        auto removed = small.bookmarks().remove(small.id(), smallBookmark, *smallValue.value());
        if (!removed) return removed.error();
        if (removed.value()) return {};
    }
    return Error{ErrorCode::TooManyRetries, "bookmark kept moving while being deleted", {smallBookmark}};
}

}
