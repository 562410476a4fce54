#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/Changeset.hpp"
#include "core/ChangesetStore.hpp"
#include "util/Expected.hpp"

namespace monosync {

class IHasher;

/**
 * @brief One file in the full tree of a changeset
 */
struct ManifestEntry {
    ContentId contentId;
    FileType fileType{FileType::Regular};
    uint64_t size{0};

    bool operator==(const ManifestEntry& o) const {
        return contentId == o.contentId && fileType == o.fileType && size == o.size;
    }
    bool operator!=(const ManifestEntry& o) const { return !(*this == o); }
};

/// Flat view of a tree: repository-relative path -> file
using Manifest = std::map<std::string, ManifestEntry>;

/**
 * @brief Derives full file trees from changesets
 *
 * Changesets only carry what changed; diff, the alternate-id scheme and the
 * repository checker need the whole tree. The manifest of a commit is its
 * first parent's manifest, plus entries from later parents that the first
 * parent lacks, with the commit's own file changes applied on top.
 * A file present in any parent is therefore present in a merge unless the
 * merge deletes it; a merge that wants a file the first parent removed
 * gone must delete it again. Earlier parents win file/directory clashes:
 * a later parent's "a" is dropped when the tree so far has "a/..." and a
 * later parent's "a/b" is dropped when the tree so far has a file "a".
 * Adding "a/b" implicitly removes a file "a"; adding a file "a" implicitly
 * removes everything under "a/".
 *
 * Manifests are derived data cached in the blobstore as "manifest.<id>".
 * Derivation of a long unmanifested history uses an explicit work stack.
 */
class ManifestBuilder {
public:
    explicit ManifestBuilder(ChangesetStore& store) : store(store) {}

    /// Full manifest for a changeset, deriving and caching ancestors as needed
    Expected<Manifest> manifestFor(const ChangesetId& id);

    /// Apply a changeset's changes to a parent manifest
    static Manifest apply(const Manifest& base, const std::map<std::string, FileChange>& changes);

    /**
     * @brief Hierarchical tree digest of a manifest
     *
     * Each directory hashes its sorted children as
     *   "<type> <name>\0<child-digest-hex>\n"
     * where files use their content id and subdirectories recurse. Two
     * manifests with the same files always produce the same digest.
     */
    static std::string treeDigest(const Manifest& manifest, IHasher& hasher);

    static std::string serialize(const Manifest& manifest);
    static Expected<Manifest> parse(const std::string& bytes);

private:
    ChangesetStore& store;

    Expected<bool> cached(const ChangesetId& id, Manifest* out);
    Expected<void> derive(const ChangesetId& id, const std::vector<Manifest>& parents);
    /// True if adding `path` to `tree` would duplicate it or clash as file vs directory
    static bool conflictsWithTree(const Manifest& tree, const std::string& path);

    static std::string treeDigestOf(const std::string& dirPath,
                                    const std::vector<std::pair<std::string, const ManifestEntry*>>& entries,
                                    IHasher& hasher);
};

}
