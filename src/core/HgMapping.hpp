#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "core/ChangesetStore.hpp"
#include "core/ManifestBuilder.hpp"
#include "core/Types.hpp"
#include "util/Expected.hpp"
#include "util/TsvFile.hpp"

namespace monosync {

/**
 * @brief Alternate-system (Mercurial style) changeset ids
 *
 * The hg id of a commit is SHA-1 over
 *
 *   p1 + p2                             parents' hg ids in parent order,
 *                                       padded with 40 zeros to two
 *   "manifest " + treeDigest + "\n"     SHA-1 tree digest of the manifest
 *   author "\n" timestamp " " tz "\n"
 *   one length-prefixed "file" record per changed path (content, type,
 *   copy source path and the copy source parent's hg id) and one per
 *   extra, sorted
 *   "message\n" + message
 *
 * Every part of a changeset feeds the hash, so distinct changesets get
 * distinct hg ids; recording an hg id that already belongs to another
 * changeset is a MappingConflict. Deriving a commit derives every ancestor
 * that lacks an hg id first.
 *
 * On-disk format: TSV "<changeset-id>\t<hg-id>", appended on derivation.
 */
class HgMapping {
public:
    HgMapping() = default;

    static Expected<std::unique_ptr<HgMapping>> open(const std::filesystem::path& path);

    /// Hg id of `id`, deriving and recording it (and missing ancestors) if needed
    Expected<HgChangesetId> derive(const ChangesetStore& store, ManifestBuilder& manifests, const ChangesetId& id);

    std::optional<HgChangesetId> get(const ChangesetId& id) const;
    std::optional<ChangesetId> getChangeset(const HgChangesetId& hg) const;

    /// Null hg id used to pad the parent list of roots and single-parent commits
    static HgChangesetId nullId();

private:
    std::optional<TsvFile> file;

    mutable std::mutex mtx;
    std::unordered_map<ChangesetId, HgChangesetId> forward;
    std::unordered_map<HgChangesetId, ChangesetId> reverse;

    Expected<HgChangesetId> record(const ChangesetId& id, const HgChangesetId& hg);
    static HgChangesetId compute(const Changeset& cs, const std::vector<HgChangesetId>& parentHgIds,
                                 const Manifest& manifest);
};

}
