#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Types.hpp"
#include "sync/CommitSyncConfig.hpp"
#include "util/Expected.hpp"
#include "util/TsvFile.hpp"

namespace monosync {

struct SyncedCommitMappingEntry {
    RepositoryId smallRepo{0};
    ChangesetId smallId;
    RepositoryId largeRepo{0};
    ChangesetId largeId;
    ConfigVersion version{0};

    bool operator==(const SyncedCommitMappingEntry& o) const {
        return smallRepo == o.smallRepo && smallId == o.smallId && largeRepo == o.largeRepo &&
               largeId == o.largeId && version == o.version;
    }
};

/**
 * @brief Append-only relation between small and large commits
 *
 * For a given repository pair and config version a small commit maps to at
 * most one large commit and a large commit to at most one small commit.
 * Entries are never changed or removed.
 *
 * insert() is idempotent for identical entries. An entry that would give an
 * already mapped commit a second counterpart fails with MappingConflict;
 * details carry the existing and the attempted counterpart.
 *
 * On-disk format: TSV
 *   "<version>\t<small-repo>\t<small-id>\t<large-repo>\t<large-id>"
 * appended before the in-memory indexes are updated.
 */
class SyncedCommitMapping {
public:
    SyncedCommitMapping() = default;

    static Expected<std::unique_ptr<SyncedCommitMapping>> open(const std::filesystem::path& path);

    /// true if added, false if the identical entry was already present
    Expected<bool> insert(const SyncedCommitMappingEntry& entry);

    std::optional<ChangesetId> getLarge(RepositoryId smallRepo, RepositoryId largeRepo, ConfigVersion version,
                                        const ChangesetId& smallId) const;
    std::optional<ChangesetId> getSmall(RepositoryId smallRepo, RepositoryId largeRepo, ConfigVersion version,
                                        const ChangesetId& largeId) const;

    /// All entries in insertion order
    std::vector<SyncedCommitMappingEntry> entries() const;

private:
    std::optional<TsvFile> file;

    mutable std::mutex mtx;
    std::vector<SyncedCommitMappingEntry> log;
    std::unordered_map<std::string, ChangesetId> smallToLarge;
    std::unordered_map<std::string, ChangesetId> largeToSmall;

    static std::string key(RepositoryId smallRepo, RepositoryId largeRepo, ConfigVersion version,
                           const ChangesetId& id);
    Expected<bool> insertLocked(const SyncedCommitMappingEntry& entry, bool persist);
};

}
