#include "sync/CommitSyncer.hpp"

#include <algorithm>
#include <unordered_set>

#include "util/Logger.hpp"

namespace monosync {

CommitSyncer::CommitSyncer(Repository& small, Repository& large, SyncedCommitMapping& mapping,
                           const CommitSyncConfigStore& configs)
    : small(small),
      large(large),
      mapping(mapping),
      configs(configs),
      commitRewriter(mapping, small.id(), large.id()) {}

std::string CommitSyncer::skipKey(Direction direction, ConfigVersion version, const ChangesetId& id) {
    return std::string(directionName(direction)) + ":" + std::to_string(version) + ":" + id.hex();
}

std::optional<std::vector<ChangesetId>> CommitSyncer::targetsOf(Direction direction, const ChangesetId& sourceId,
                                                                ConfigVersion version) const {
    if (auto m = commitRewriter.mapped(sourceId, direction, version)) {
        return std::vector<ChangesetId>{*m};
    }
    std::scoped_lock lock(skipMtx);
    auto it = skippedCommits.find(skipKey(direction, version, sourceId));
    if (it == skippedCommits.end()) return std::nullopt;
    return it->second;
}

Expected<std::vector<ChangesetId>> CommitSyncer::collectUnsynced(Direction direction, const ChangesetId& sourceId,
                                                                 ConfigVersion version) {
    ChangesetStore& source = sourceRepo(direction).changesets();
    std::vector<std::pair<uint64_t, ChangesetId>> pending;
    std::unordered_set<ChangesetId> seen{sourceId};
    std::vector<ChangesetId> stack{sourceId};
    while (!stack.empty()) {
        ChangesetId current = stack.back();
        stack.pop_back();
        if (targetsOf(direction, current, version)) continue;

        auto gen = source.generation(current);
        if (!gen) return gen.error();
        pending.emplace_back(gen.value(), current);

        auto ps = source.parents(current);
        if (!ps) return ps.error();
        for (const auto& p : ps.value()) {
            if (seen.insert(p).second) stack.push_back(p);
        }
    }
    std::sort(pending.begin(), pending.end());

    std::vector<ChangesetId> order;
    order.reserve(pending.size());
    for (const auto& entry : pending) order.push_back(entry.second);
    return order;
}

Expected<ChangesetId> CommitSyncer::storeRewritten(Direction direction, const Changeset& source,
                                                   Changeset rewritten) {
    if (direction == Direction::LargeToSmall) {
        auto origin = syncSourceOf(source);
        if (origin && origin->first == small.id()) {
            auto existing = small.changesets().get(origin->second);
            if (existing && existing.value().parents == rewritten.parents) {
                return origin->second;
            }
            if (!existing && existing.error().code != ErrorCode::NotFound) return existing.error();
        }
    }
    ChangesetStore& target = targetRepo(direction).changesets();
    auto imported = target.importContents(sourceRepo(direction).changesets(), rewritten);
    if (!imported) return imported.error();
    return target.put(rewritten);
}

Expected<SyncOutcome> CommitSyncer::sync(Direction direction, const ChangesetId& sourceId) {
    SyncVersionConfig config = configs.current();
    SyncOutcome outcome;

    auto order = collectUnsynced(direction, sourceId, config.version);
    if (!order) return order.error();

    ChangesetStore& source = sourceRepo(direction).changesets();
    for (const auto& id : order.value()) {
        auto cs = source.get(id);
        if (!cs) return cs.error();

        ParentOverrides overrides;
        std::vector<ChangesetId> substitutes;
        for (const auto& p : cs.value().parents) {
            auto targets = targetsOf(direction, p, config.version);
            if (!targets) {
                return Error{ErrorCode::InternalError, "ancestor was not synced before its descendant",
                             {id.hex(), p.hex()}};
            }
            if (!commitRewriter.mapped(p, direction, config.version)) overrides[p] = *targets;
            for (const auto& t : *targets) {
                if (std::find(substitutes.begin(), substitutes.end(), t) == substitutes.end()) {
                    substitutes.push_back(t);
                }
            }
        }

        auto result = commitRewriter.rewrite(id, cs.value(), direction, config, overrides);
        if (!result) return result.error();

        if (result.value().skipped()) {
            std::scoped_lock lock(skipMtx);
            skippedCommits[skipKey(direction, config.version, id)] = substitutes;
            ++outcome.skipped;
            continue;
        }

        auto target = storeRewritten(direction, cs.value(), std::move(*result.value().changeset));
        if (!target) return target.error();

        SyncedCommitMappingEntry entry;
        entry.smallRepo = small.id();
        entry.largeRepo = large.id();
        entry.version = config.version;
        entry.smallId = direction == Direction::SmallToLarge ? id : target.value();
        entry.largeId = direction == Direction::SmallToLarge ? target.value() : id;
        auto inserted = mapping.insert(entry);
        if (!inserted) return inserted.error();
        if (inserted.value()) outcome.synced.emplace_back(id, target.value());
    }

    auto targets = targetsOf(direction, sourceId, config.version);
    if (targets && !targets->empty()) outcome.target = targets->front();
    Logger::instance().info("synced " + sourceId.shortHex() + " (" + directionName(direction) + "): " +
                            std::to_string(outcome.synced.size()) + " new, " +
                            std::to_string(outcome.skipped) + " skipped");
    return outcome;
}

Expected<size_t> CommitSyncer::recover(const std::string& largeBookmark) {
    auto head = large.bookmark(largeBookmark);
    if (!head) return head.error();
    if (!head.value()) return static_cast<size_t>(0);
    auto outcome = sync(Direction::LargeToSmall, *head.value());
    if (!outcome) return outcome.error();
    return outcome.value().synced.size();
}

}
