#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Blobstore.hpp"
#include "core/Changeset.hpp"
#include "util/Expected.hpp"

namespace monosync {

/**
 * @brief Content-addressed store of immutable changesets and file contents
 *
 * Blob layout:
 *   changeset.<id>   canonical serialization (Changeset::serialize)
 *   generation.<id>  decimal generation number (1 for roots)
 *   content.<id>     raw file bytes, id = SHA-256("content <size>\0" + bytes)
 *
 * Invariants:
 *   - put() is idempotent and only accepts a changeset whose parents are
 *     already stored, so every stored commit has its full history stored.
 *   - get() re-hashes what it reads; bytes that do not match the requested
 *     id are reported as CorruptObject.
 *   - generation(c) = 1 + max(generation(parents)); a parent always has a
 *     strictly smaller generation than its children. Graph walks below rely
 *     on this ordering instead of recursion.
 *
 * Thread-safe; the blobstore can be shared between stores.
 */
class ChangesetStore {
public:
    explicit ChangesetStore(std::shared_ptr<Blobstore> blobstore);

    /// Store a changeset; returns its content address
    Expected<ChangesetId> put(const Changeset& cs);

    /// Load a changeset (NotFound if absent)
    Expected<Changeset> get(const ChangesetId& id) const;

    Expected<bool> exists(const ChangesetId& id) const;

    Expected<std::vector<ChangesetId>> parents(const ChangesetId& id) const;

    Expected<uint64_t> generation(const ChangesetId& id) const;

    /// Store file content; returns its content id
    Expected<ContentId> putContent(const std::string& bytes);

    Expected<std::string> getContent(const ContentId& id) const;

    /**
     * @brief Copy the contents a changeset refers to from another store
     *
     * Used when a commit is rewritten into another repository: the rewrite
     * keeps content ids, so the bytes have to follow. Contents already
     * present are not read again. Returns the number of blobs copied.
     */
    Expected<size_t> importContents(const ChangesetStore& from, const Changeset& cs);

    /// Content id a blob would get, without storing it
    static ContentId contentIdOf(const std::string& bytes);

    /// True if `ancestor` is reachable from `descendant` (a commit is its own ancestor)
    Expected<bool> isAncestor(const ChangesetId& ancestor, const ChangesetId& descendant) const;

    /**
     * @brief Commits reachable from any of `include` but from none of `exclude`
     *
     * Returned in decreasing generation order (children before parents).
     * Walks only the part of the graph above the excluded frontier.
     */
    Expected<std::vector<ChangesetId>> difference(const std::vector<ChangesetId>& include,
                                                  const std::vector<ChangesetId>& exclude) const;

    Blobstore& blobstore() { return *blobs; }
    const Blobstore& blobstore() const { return *blobs; }
    std::shared_ptr<Blobstore> sharedBlobstore() const { return blobs; }

private:
    std::shared_ptr<Blobstore> blobs;

    mutable std::mutex cacheMtx;
    mutable std::unordered_map<ChangesetId, std::vector<ChangesetId>> parentCache;
    mutable std::unordered_map<ChangesetId, uint64_t> generationCache;
};

}
