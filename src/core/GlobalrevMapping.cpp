#include "core/GlobalrevMapping.hpp"

#include "util/Logger.hpp"

namespace monosync {

Expected<std::unique_ptr<GlobalrevMapping>> GlobalrevMapping::open(const std::filesystem::path& path) {
    auto mapping = std::make_unique<GlobalrevMapping>();
    mapping->file.emplace(path);

    auto records = mapping->file->load();
    if (!records) return records.error();
    for (const auto& record : records.value()) {
        std::optional<ChangesetId> id;
        uint64_t rev = 0;
        if (record.size() == 2) {
            id = ChangesetId::fromHex(record[1]);
            try {
                rev = std::stoull(record[0]);
            } catch (const std::exception&) {
                id.reset();
            }
        }
        if (!id || rev == 0) {
            Logger::instance().warn("skipping malformed globalrev record in " + path.string());
            continue;
        }
        if (mapping->byChangeset.count(*id) || mapping->byGlobalrev.count(rev)) {
            return Error{ErrorCode::CorruptObject, "globalrev table assigns a number or commit twice",
                         {std::to_string(rev), id->hex()}};
        }
        mapping->byChangeset.emplace(*id, rev);
        mapping->byGlobalrev.emplace(rev, *id);
    }
    return mapping;
}

Expected<uint64_t> GlobalrevMapping::assign(const ChangesetId& id) {
    std::scoped_lock lock(mtx);
    auto it = byChangeset.find(id);
    if (it != byChangeset.end()) return it->second;

    uint64_t next = byGlobalrev.empty() ? 1 : byGlobalrev.rbegin()->first + 1;
    if (file) {
        auto written = file->append({std::to_string(next), id.hex()});
        if (!written) return written.error();
    }
    byChangeset.emplace(id, next);
    byGlobalrev.emplace(next, id);
    Logger::instance().debug("assigned globalrev " + std::to_string(next) + " to " + id.shortHex());
    return next;
}

std::optional<uint64_t> GlobalrevMapping::get(const ChangesetId& id) const {
    std::scoped_lock lock(mtx);
    auto it = byChangeset.find(id);
    if (it == byChangeset.end()) return std::nullopt;
    return it->second;
}

std::optional<ChangesetId> GlobalrevMapping::getChangeset(uint64_t globalrev) const {
    std::scoped_lock lock(mtx);
    auto it = byGlobalrev.find(globalrev);
    if (it == byGlobalrev.end()) return std::nullopt;
    return it->second;
}

uint64_t GlobalrevMapping::last() const {
    std::scoped_lock lock(mtx);
    return byGlobalrev.empty() ? 0 : byGlobalrev.rbegin()->first;
}

}
