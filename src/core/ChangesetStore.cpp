#include "core/ChangesetStore.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "core/Constants.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"

namespace monosync {

namespace {

std::string changesetKey(const ChangesetId& id) {
    return std::string(Constants::KEY_CHANGESET) + "." + id.hex();
}

std::string generationKey(const ChangesetId& id) {
    return std::string(Constants::KEY_GENERATION) + "." + id.hex();
}

std::string contentKey(const ContentId& id) {
    return std::string(Constants::KEY_CONTENT) + "." + id.hex();
}

Error storageError(const std::exception& e) {
    return Error{ErrorCode::IoError, std::string("blobstore failure: ") + e.what()};
}

}

ChangesetStore::ChangesetStore(std::shared_ptr<Blobstore> blobstore)
    : blobs(std::move(blobstore)) {}

Expected<ChangesetId> ChangesetStore::put(const Changeset& cs) {
    auto valid = cs.verify();
    if (!valid) return valid.error();

    uint64_t gen = 1;
    for (const auto& p : cs.parents) {
        auto parentGen = generation(p);
        if (!parentGen) {
            if (parentGen.error().code == ErrorCode::NotFound) {
                return Error{ErrorCode::InvalidArgs, "parent is not stored", {p.hex()}};
            }
            return parentGen.error();
        }
        gen = std::max(gen, parentGen.value() + 1);
    }

    ChangesetId id = cs.computeId();
    try {
        // Generation first: a generation blob without its changeset is inert.
        blobs->put(generationKey(id), std::to_string(gen));
        blobs->put(changesetKey(id), cs.serialize());
    } catch (const std::exception& e) {
        return storageError(e);
    }

    {
        std::scoped_lock lock(cacheMtx);
        parentCache[id] = cs.parents;
        generationCache[id] = gen;
    }
    Logger::instance().debug("stored changeset " + id.shortHex() + " (generation " + std::to_string(gen) + ")");
    return id;
}

Expected<Changeset> ChangesetStore::get(const ChangesetId& id) const {
    std::optional<std::string> bytes;
    try {
        bytes = blobs->get(changesetKey(id));
    } catch (const std::exception& e) {
        return storageError(e);
    }
    if (!bytes) {
        return Error{ErrorCode::NotFound, "changeset not found", {id.hex()}};
    }

    auto parsed = Changeset::parse(*bytes);
    if (!parsed) return parsed.error();
    ChangesetId actual = parsed.value().computeId();
    if (actual != id) {
        return Error{ErrorCode::CorruptObject, "changeset content does not match its id",
                     {id.hex(), actual.hex()}};
    }
    return parsed;
}

Expected<bool> ChangesetStore::exists(const ChangesetId& id) const {
    if (id.empty()) return false;
    {
        std::scoped_lock lock(cacheMtx);
        if (parentCache.count(id)) return true;
    }
    try {
        return blobs->exists(changesetKey(id));
    } catch (const std::exception& e) {
        return storageError(e);
    }
}

Expected<std::vector<ChangesetId>> ChangesetStore::parents(const ChangesetId& id) const {
    {
        std::scoped_lock lock(cacheMtx);
        auto it = parentCache.find(id);
        if (it != parentCache.end()) return it->second;
    }
    auto cs = get(id);
    if (!cs) return cs.error();
    std::scoped_lock lock(cacheMtx);
    parentCache[id] = cs.value().parents;
    return cs.value().parents;
}

Expected<uint64_t> ChangesetStore::generation(const ChangesetId& id) const {
    {
        std::scoped_lock lock(cacheMtx);
        auto it = generationCache.find(id);
        if (it != generationCache.end()) return it->second;
    }
    std::optional<std::string> text;
    try {
        if (!blobs->exists(changesetKey(id))) {
            return Error{ErrorCode::NotFound, "changeset not found", {id.hex()}};
        }
        text = blobs->get(generationKey(id));
    } catch (const std::exception& e) {
        return storageError(e);
    }
    if (!text) {
        return Error{ErrorCode::CorruptObject, "changeset has no generation number", {id.hex()}};
    }
    uint64_t gen = 0;
    try {
        gen = std::stoull(*text);
    } catch (const std::exception&) {
        return Error{ErrorCode::CorruptObject, "malformed generation number", {id.hex(), *text}};
    }
    std::scoped_lock lock(cacheMtx);
    generationCache[id] = gen;
    return gen;
}

ContentId ChangesetStore::contentIdOf(const std::string& bytes) {
    std::string header = "content " + std::to_string(bytes.size());
    header += '\0';
    auto hasher = HasherFactory::createDefault();
    hasher->update(header);
    hasher->update(bytes);
    return ContentId(hasher->hexDigest());
}

Expected<ContentId> ChangesetStore::putContent(const std::string& bytes) {
    ContentId id = contentIdOf(bytes);
    try {
        blobs->put(contentKey(id), bytes);
    } catch (const std::exception& e) {
        return storageError(e);
    }
    return id;
}

Expected<std::string> ChangesetStore::getContent(const ContentId& id) const {
    std::optional<std::string> bytes;
    try {
        bytes = blobs->get(contentKey(id));
    } catch (const std::exception& e) {
        return storageError(e);
    }
    if (!bytes) {
        return Error{ErrorCode::NotFound, "file content not found", {id.hex()}};
    }
    return *bytes;
}

Expected<size_t> ChangesetStore::importContents(const ChangesetStore& from, const Changeset& cs) {
    if (from.blobs == blobs) return static_cast<size_t>(0);
    size_t copied = 0;
    for (const auto& [path, change] : cs.fileChanges) {
        if (change.isDeleted()) continue;
        try {
            if (blobs->exists(contentKey(change.contentId))) continue;
        } catch (const std::exception& e) {
            return storageError(e);
        }
        auto bytes = from.getContent(change.contentId);
        if (!bytes) {
            Error err = bytes.error();
            err.details.push_back(path);
            return err;
        }
        auto stored = putContent(bytes.value());
        if (!stored) return stored.error();
        ++copied;
    }
    return copied;
}

Expected<bool> ChangesetStore::isAncestor(const ChangesetId& ancestor, const ChangesetId& descendant) const {
    if (ancestor == descendant) return true;
    auto ancestorGen = generation(ancestor);
    if (!ancestorGen) return ancestorGen.error();

    std::vector<ChangesetId> frontier{descendant};
    std::unordered_set<ChangesetId> seen{descendant};
    while (!frontier.empty()) {
        ChangesetId current = frontier.back();
        frontier.pop_back();
        auto gen = generation(current);
        if (!gen) return gen.error();
        if (gen.value() <= ancestorGen.value()) continue;

        auto ps = parents(current);
        if (!ps) return ps.error();
        for (const auto& p : ps.value()) {
            if (p == ancestor) return true;
            if (seen.insert(p).second) frontier.push_back(p);
        }
    }
    return false;
}

Expected<std::vector<ChangesetId>> ChangesetStore::difference(const std::vector<ChangesetId>& include,
                                                              const std::vector<ChangesetId>& exclude) const {
    // Max-heap on generation: every child is popped before its parents, so
    // by the time a commit is popped its "excluded" flag is final.
    using Entry = std::pair<uint64_t, ChangesetId>;
    std::priority_queue<Entry> heap;
    std::unordered_map<ChangesetId, bool> excluded;
    size_t pendingIncluded = 0;

    auto enqueue = [&](const ChangesetId& id, bool isExcluded) -> Expected<void> {
        auto it = excluded.find(id);
        if (it != excluded.end()) {
            if (isExcluded && !it->second) {
                it->second = true;
                --pendingIncluded;
            }
            return {};
        }
        auto gen = generation(id);
        if (!gen) return gen.error();
        excluded[id] = isExcluded;
        if (!isExcluded) ++pendingIncluded;
        heap.emplace(gen.value(), id);
        return {};
    };

    for (const auto& id : exclude) {
        auto r = enqueue(id, true);
        if (!r) return r.error();
    }
    for (const auto& id : include) {
        auto r = enqueue(id, false);
        if (!r) return r.error();
    }

    std::vector<ChangesetId> out;
    while (!heap.empty() && pendingIncluded > 0) {
        ChangesetId current = heap.top().second;
        heap.pop();
        bool isExcluded = excluded[current];
        if (!isExcluded) {
            --pendingIncluded;
            out.push_back(current);
        }
        auto ps = parents(current);
        if (!ps) return ps.error();
        for (const auto& p : ps.value()) {
            auto r = enqueue(p, isExcluded);
            if (!r) return r.error();
        }
    }
    return out;
}

}
