#include "sync/SyncedCommitMapping.hpp"

#include "util/Logger.hpp"

namespace monosync {

std::string SyncedCommitMapping::key(RepositoryId smallRepo, RepositoryId largeRepo, ConfigVersion version,
                                     const ChangesetId& id) {
    return std::to_string(smallRepo) + ":" + std::to_string(largeRepo) + ":" + std::to_string(version) + ":" + id.hex();
}

Expected<std::unique_ptr<SyncedCommitMapping>> SyncedCommitMapping::open(const std::filesystem::path& path) {
    auto mapping = std::make_unique<SyncedCommitMapping>();
    mapping->file.emplace(path);

    auto records = mapping->file->load();
    if (!records) return records.error();
    for (const auto& record : records.value()) {
        std::optional<SyncedCommitMappingEntry> entry;
        if (record.size() == 5) {
            auto smallId = ChangesetId::fromHex(record[2]);
            auto largeId = ChangesetId::fromHex(record[4]);
            try {
                if (smallId && largeId) {
                    entry = SyncedCommitMappingEntry{static_cast<RepositoryId>(std::stol(record[1])), *smallId,
                                                     static_cast<RepositoryId>(std::stol(record[3])), *largeId,
                                                     static_cast<ConfigVersion>(std::stoul(record[0]))};
                }
            } catch (const std::exception&) {
                entry.reset();
            }
        }
        if (!entry) {
            Logger::instance().warn("skipping malformed synced commit mapping record in " + path.string());
            continue;
        }
        auto inserted = mapping->insertLocked(*entry, false);
        if (!inserted) {
            return Error{ErrorCode::CorruptObject, "synced commit mapping file holds conflicting entries",
                         inserted.error().details};
        }
    }
    return mapping;
}

Expected<bool> SyncedCommitMapping::insert(const SyncedCommitMappingEntry& entry) {
    std::scoped_lock lock(mtx);
    return insertLocked(entry, true);
}

Expected<bool> SyncedCommitMapping::insertLocked(const SyncedCommitMappingEntry& entry, bool persist) {
    std::string smallKey = key(entry.smallRepo, entry.largeRepo, entry.version, entry.smallId);
    std::string largeKey = key(entry.smallRepo, entry.largeRepo, entry.version, entry.largeId);

    auto existingLarge = smallToLarge.find(smallKey);
    auto existingSmall = largeToSmall.find(largeKey);
    bool smallKnown = existingLarge != smallToLarge.end();
    bool largeKnown = existingSmall != largeToSmall.end();

    if (smallKnown && existingLarge->second != entry.largeId) {
        Logger::instance().error("mapping conflict: small " + entry.smallId.shortHex() + " already maps to " +
                                 existingLarge->second.shortHex() + ", refusing " + entry.largeId.shortHex());
        return Error{ErrorCode::MappingConflict, "small commit is already mapped to a different large commit",
                     {"small " + entry.smallId.hex(), "existing large " + existingLarge->second.hex(),
                      "attempted large " + entry.largeId.hex(), "version " + std::to_string(entry.version)}};
    }
    if (largeKnown && existingSmall->second != entry.smallId) {
        Logger::instance().error("mapping conflict: large " + entry.largeId.shortHex() + " already maps to " +
                                 existingSmall->second.shortHex() + ", refusing " + entry.smallId.shortHex());
        return Error{ErrorCode::MappingConflict, "large commit is already mapped to a different small commit",
                     {"large " + entry.largeId.hex(), "existing small " + existingSmall->second.hex(),
                      "attempted small " + entry.smallId.hex(), "version " + std::to_string(entry.version)}};
    }
    if (smallKnown && largeKnown) return false;

    if (persist && file) {
        auto written = file->append({std::to_string(entry.version), std::to_string(entry.smallRepo),
                                     entry.smallId.hex(), std::to_string(entry.largeRepo), entry.largeId.hex()});
        if (!written) return written.error();
    }
    smallToLarge.emplace(smallKey, entry.largeId);
    largeToSmall.emplace(largeKey, entry.smallId);
    log.push_back(entry);
    return true;
}

std::optional<ChangesetId> SyncedCommitMapping::getLarge(RepositoryId smallRepo, RepositoryId largeRepo,
                                                         ConfigVersion version, const ChangesetId& smallId) const {
    std::scoped_lock lock(mtx);
    auto it = smallToLarge.find(key(smallRepo, largeRepo, version, smallId));
    if (it == smallToLarge.end()) return std::nullopt;
    return it->second;
}

std::optional<ChangesetId> SyncedCommitMapping::getSmall(RepositoryId smallRepo, RepositoryId largeRepo,
                                                         ConfigVersion version, const ChangesetId& largeId) const {
    std::scoped_lock lock(mtx);
    auto it = largeToSmall.find(key(smallRepo, largeRepo, version, largeId));
    if (it == largeToSmall.end()) return std::nullopt;
    return it->second;
}

std::vector<SyncedCommitMappingEntry> SyncedCommitMapping::entries() const {
    std::scoped_lock lock(mtx);
    return log;
}

}
