#include "sync/Pushrebase.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "util/Logger.hpp"

namespace monosync {

std::vector<std::string> conflictingPaths(const std::set<std::string>& pushed, const std::set<std::string>& server) {
    std::vector<std::string> out;
    for (const auto& path : pushed) {
        bool conflict = server.count(path) > 0;
        // A server path that is a directory above the pushed path
        for (size_t slash = path.find('/'); !conflict && slash != std::string::npos;
             slash = path.find('/', slash + 1)) {
            conflict = server.count(path.substr(0, slash)) > 0;
        }
        // A server path below the pushed path
        if (!conflict) {
            std::string dir = path + "/";
            auto it = server.lower_bound(dir);
            conflict = it != server.end() && it->compare(0, dir.size(), dir) == 0;
        }
        if (conflict) out.push_back(path);
    }
    return out;
}

Expected<PushrebaseEngine::Batch> PushrebaseEngine::loadBatch(const std::vector<ChangesetId>& commits) const {
    if (commits.empty()) {
        return Error{ErrorCode::InvalidArgs, "nothing to push"};
    }

    std::unordered_set<ChangesetId> members(commits.begin(), commits.end());
    std::vector<std::pair<uint64_t, ChangesetId>> ordered;
    for (const auto& id : members) {
        auto gen = repo.changesets().generation(id);
        if (!gen) return gen.error();
        ordered.emplace_back(gen.value(), id);
    }
    std::sort(ordered.begin(), ordered.end());

    Batch batch;
    std::set<ChangesetId> bases;
    std::unordered_set<ChangesetId> haveChildren;
    for (const auto& entry : ordered) {
        auto cs = repo.changesets().get(entry.second);
        if (!cs) return cs.error();
        for (const auto& p : cs.value().parents) {
            if (members.count(p)) {
                haveChildren.insert(p);
            } else {
                bases.insert(p);
            }
        }
        for (const auto& [path, change] : cs.value().fileChanges) {
            batch.touchedPaths.insert(path);
            if (change.copyFrom && !members.count(change.copyFrom->changeset)) {
                batch.touchedPaths.insert(change.copyFrom->path);
            }
        }
        batch.ids.push_back(entry.second);
        batch.commits.push_back(std::move(cs.value()));
    }

    if (bases.size() > 1) {
        std::vector<std::string> details;
        for (const auto& b : bases) details.push_back(b.hex());
        return Error{ErrorCode::InvalidArgs, "pushed commits have more than one base", details};
    }
    if (!bases.empty()) batch.base = *bases.begin();

    std::vector<ChangesetId> tips;
    for (const auto& id : batch.ids) {
        if (!haveChildren.count(id)) tips.push_back(id);
    }
    if (tips.size() != 1) {
        std::vector<std::string> details;
        for (const auto& t : tips) details.push_back(t.hex());
        return Error{ErrorCode::InvalidArgs, "pushed commits must have exactly one head", details};
    }
    batch.tip = tips.front();
    return batch;
}

Expected<std::set<std::string>> PushrebaseEngine::serverPaths(const ChangesetId& head,
                                                              const std::optional<ChangesetId>& base) {
    std::set<std::string> paths;
    if (!base) {
        auto manifest = repo.manifests().manifestFor(head);
        if (!manifest) return manifest.error();
        for (const auto& entry : manifest.value()) paths.insert(entry.first);
        return paths;
    }

    auto landed = repo.changesets().difference({head}, {*base});
    if (!landed) return landed.error();
    for (const auto& id : landed.value()) {
        auto cs = repo.changesets().get(id);
        if (!cs) return cs.error();
        for (const auto& entry : cs.value().fileChanges) paths.insert(entry.first);
    }
    return paths;
}

Expected<std::vector<std::pair<ChangesetId, ChangesetId>>> PushrebaseEngine::rebaseOnto(const Batch& batch,
                                                                                         const ChangesetId& head) {
    std::unordered_map<ChangesetId, ChangesetId> remap;
    if (batch.base) remap[*batch.base] = head;

    std::vector<std::pair<ChangesetId, ChangesetId>> out;
    for (size_t i = 0; i < batch.commits.size(); ++i) {
        Changeset cs = batch.commits[i];
        if (cs.parents.empty()) {
            cs.parents.push_back(head);
        } else {
            for (auto& p : cs.parents) {
                auto it = remap.find(p);
                if (it != remap.end()) p = it->second;
            }
        }
        for (auto& entry : cs.fileChanges) {
            auto& copyFrom = entry.second.copyFrom;
            if (!copyFrom) continue;
            auto it = remap.find(copyFrom->changeset);
            if (it != remap.end()) copyFrom->changeset = it->second;
        }

        auto newId = repo.changesets().put(cs);
        if (!newId) return newId.error();
        remap[batch.ids[i]] = newId.value();
        out.emplace_back(batch.ids[i], newId.value());
    }
    return out;
}

Expected<PushrebaseOutcome> PushrebaseEngine::rebase(const std::string& bookmark,
                                                     const std::vector<ChangesetId>& commits) {
    if (!isValidBookmarkName(bookmark)) {
        return Error{ErrorCode::InvalidArgs, "invalid bookmark name", {bookmark}};
    }
    auto loaded = loadBatch(commits);
    if (!loaded) return loaded.error();
    const Batch& batch = loaded.value();

    std::vector<std::pair<ChangesetId, ChangesetId>> unchanged;
    for (const auto& id : batch.ids) unchanged.emplace_back(id, id);

    for (int attempt = 0;; ++attempt) {
        auto head = repo.bookmark(bookmark);
        if (!head) return head.error();

        PushrebaseOutcome outcome;
        outcome.oldHead = head.value();
        outcome.retries = attempt;

        if (head.value()) {
            const ChangesetId& h = *head.value();
            auto landed = repo.changesets().isAncestor(batch.tip, h);
            if (!landed) return landed.error();
            if (landed.value()) {
                Logger::instance().info("pushrebase " + bookmark + ": pushed commits already at " + h.shortHex());
                outcome.newHead = h;
                outcome.rebased = unchanged;
                return outcome;
            }

            bool fastForward = false;
            if (batch.base) {
                auto behind = repo.changesets().isAncestor(h, *batch.base);
                if (!behind) return behind.error();
                fastForward = behind.value();
            }

            if (fastForward) {
                outcome.rebased = unchanged;
            } else {
                auto paths = serverPaths(h, batch.base);
                if (!paths) return paths.error();
                auto conflicts = conflictingPaths(batch.touchedPaths, paths.value());
                if (!conflicts.empty()) {
                    Logger::instance().info("pushrebase " + bookmark + ": " + std::to_string(conflicts.size()) +
                                            " conflicting path(s)");
                    return Error{ErrorCode::RebaseConflict, "pushed commits conflict with " + bookmark, conflicts};
                }
                auto rebased = rebaseOnto(batch, h);
                if (!rebased) return rebased.error();
                outcome.rebased = std::move(rebased.value());
            }
        } else {
            outcome.rebased = unchanged;
        }
        outcome.newHead = outcome.rebased.back().second;

        auto swapped = repo.bookmarks().compareAndSwap(repo.id(), bookmark, head.value(), outcome.newHead);
        if (!swapped) return swapped.error();
        if (swapped.value()) {
            outcome.published = true;
            Logger::instance().info("pushrebase " + bookmark + ": moved to " + outcome.newHead.shortHex() +
                                    " after " + std::to_string(attempt) + " retries");
            return outcome;
        }

        if (attempt >= params.maxRetries) {
            return Error{ErrorCode::TooManyRetries, "bookmark " + bookmark + " kept moving during pushrebase",
                         {std::to_string(attempt + 1) + " attempts"}};
        }
        Logger::instance().warn("pushrebase " + bookmark + ": bookmark moved, retrying (attempt " +
                                std::to_string(attempt + 2) + ")");
    }
}

Expected<bool> PushrebaseEngine::createBookmark(const std::string& name, const ChangesetId& target) {
    auto present = repo.changesets().exists(target);
    if (!present) return present.error();
    if (!present.value()) return Error{ErrorCode::NotFound, "bookmark target is not stored", {target.hex()}};
    auto created = repo.bookmarks().compareAndSwap(repo.id(), name, std::nullopt, target);
    if (created && created.value()) {
        Logger::instance().info("created bookmark " + name + " at " + target.shortHex());
    }
    return created;
}

Expected<bool> PushrebaseEngine::deleteBookmark(const std::string& name, const ChangesetId& expected) {
    auto removed = repo.bookmarks().remove(repo.id(), name, expected);
    if (removed && removed.value()) {
        Logger::instance().info("deleted bookmark " + name);
    }
    return removed;
}

Expected<bool> PushrebaseEngine::moveBookmark(const std::string& name, const ChangesetId& expected,
                                              const ChangesetId& target) {
    auto ff = repo.changesets().isAncestor(expected, target);
    if (!ff) return ff.error();
    if (!ff.value()) {
        return Error{ErrorCode::InvalidArgs, "bookmark move is not a fast-forward", {name, expected.hex(), target.hex()}};
    }
    auto moved = repo.bookmarks().compareAndSwap(repo.id(), name, expected, target);
    if (moved && moved.value()) {
        Logger::instance().info("moved bookmark " + name + " to " + target.shortHex());
    }
    return moved;
}

}
