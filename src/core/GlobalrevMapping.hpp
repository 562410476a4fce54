#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "core/Types.hpp"
#include "util/Expected.hpp"
#include "util/TsvFile.hpp"

namespace monosync {

/**
 * @brief Legacy sequential revision numbers ("globalrevs")
 *
 * A commit receives at most one number, numbers strictly increase in
 * assignment order and are never reused. Some commits never receive one.
 *
 * On-disk format: TSV "<globalrev>\t<changeset-id>", one line per
 * assignment, appended before the in-memory index is updated. The first
 * assigned number is 1.
 */
class GlobalrevMapping {
public:
    /// In-memory table
    GlobalrevMapping() = default;

    /// Load the durable table at `path`
    static Expected<std::unique_ptr<GlobalrevMapping>> open(const std::filesystem::path& path);

    /// Assign the next number, or return the one already assigned
    Expected<uint64_t> assign(const ChangesetId& id);

    std::optional<uint64_t> get(const ChangesetId& id) const;
    std::optional<ChangesetId> getChangeset(uint64_t globalrev) const;

    /// Highest number issued so far (0 if none)
    uint64_t last() const;

private:
    std::optional<TsvFile> file;

    mutable std::mutex mtx;
    std::unordered_map<ChangesetId, uint64_t> byChangeset;
    std::map<uint64_t, ChangesetId> byGlobalrev;
};

}
