#include "core/HgMapping.hpp"

#include <algorithm>
#include <vector>

#include "util/IHasher.hpp"
#include "util/Logger.hpp"

namespace monosync {

Expected<std::unique_ptr<HgMapping>> HgMapping::open(const std::filesystem::path& path) {
    auto mapping = std::make_unique<HgMapping>();
    mapping->file.emplace(path);

    auto records = mapping->file->load();
    if (!records) return records.error();
    for (const auto& record : records.value()) {
        if (record.size() != 2) {
            Logger::instance().warn("skipping malformed hg mapping record in " + path.string());
            continue;
        }
        auto id = ChangesetId::fromHex(record[0]);
        auto hg = HgChangesetId::fromHex(record[1]);
        if (!id || !hg) {
            Logger::instance().warn("skipping malformed hg mapping record in " + path.string());
            continue;
        }
        auto owner = mapping->reverse.find(*hg);
        if (owner != mapping->reverse.end() && owner->second != *id) {
            return Error{ErrorCode::CorruptObject, "hg id recorded for two changesets",
                         {path.string(), hg->hex()}};
        }
        mapping->forward.emplace(*id, *hg);
        mapping->reverse.emplace(*hg, *id);
    }
    return mapping;
}

HgChangesetId HgMapping::nullId() {
    return HgChangesetId(std::string(Constants::HG_ID_HEX_LENGTH, '0'));
}

HgChangesetId HgMapping::compute(const Changeset& cs, const std::vector<HgChangesetId>& parentHgIds,
                                 const Manifest& manifest) {
    std::vector<HgChangesetId> parents = parentHgIds;
    while (parents.size() < 2) parents.push_back(nullId());

    auto treeHasher = HasherFactory::createAlternate();
    std::string tree = ManifestBuilder::treeDigest(manifest, *treeHasher);

    auto hasher = HasherFactory::createAlternate();
    for (const auto& p : parents) hasher->update(p.hex());
    hasher->update("manifest " + tree + "\n");
    hasher->update(cs.author + "\n");
    hasher->update(std::to_string(cs.authorTimestamp) + " " + std::to_string(cs.authorTzOffset) + "\n");

    // Changed files with their copy metadata, like the files list and
    // filelog copy headers of an hg changeset
    for (const auto& [path, change] : cs.fileChanges) {
        std::string line = "file " + path + '\0';
        if (change.isDeleted()) {
            line += "deleted";
        } else {
            line += change.contentId.hex() + " " + fileTypeName(change.fileType);
            if (change.copyFrom) {
                auto source = std::find(cs.parents.begin(), cs.parents.end(), change.copyFrom->changeset);
                size_t index = static_cast<size_t>(source - cs.parents.begin());
                std::string sourceHg = index < parentHgIds.size() ? parentHgIds[index].hex() : nullId().hex();
                line += " copy " + change.copyFrom->path + '\0' + sourceHg;
            }
        }
        hasher->update(std::to_string(line.size()) + ":" + line + "\n");
    }
    for (const auto& [key, value] : cs.extras) {
        std::string line = "extra " + key + '\0' + value;
        hasher->update(std::to_string(line.size()) + ":" + line + "\n");
    }

    hasher->update("message\n" + cs.message);
    return HgChangesetId(hasher->hexDigest());
}

Expected<HgChangesetId> HgMapping::record(const ChangesetId& id, const HgChangesetId& hg) {
    std::scoped_lock lock(mtx);
    auto it = forward.find(id);
    if (it != forward.end()) return it->second;
    auto taken = reverse.find(hg);
    if (taken != reverse.end()) {
        Logger::instance().error("hg id " + hg.hex() + " already belongs to " + taken->second.shortHex());
        return Error{ErrorCode::MappingConflict, "hg id already maps to another changeset",
                     {hg.hex(), "existing " + taken->second.hex(), "attempted " + id.hex()}};
    }
    if (file) {
        auto written = file->append({id.hex(), hg.hex()});
        if (!written) return written.error();
    }
    forward.emplace(id, hg);
    reverse.emplace(hg, id);
    return hg;
}

Expected<HgChangesetId> HgMapping::derive(const ChangesetStore& store, ManifestBuilder& manifests,
                                          const ChangesetId& id) {
    if (auto known = get(id)) return *known;

    // Ancestors first, with an explicit stack
    std::vector<ChangesetId> stack{id};
    while (!stack.empty()) {
        ChangesetId current = stack.back();
        if (get(current)) {
            stack.pop_back();
            continue;
        }
        auto cs = store.get(current);
        if (!cs) return cs.error();

        std::vector<HgChangesetId> parentHgIds;
        bool missing = false;
        for (const auto& p : cs.value().parents) {
            auto parentHg = get(p);
            if (parentHg) {
                parentHgIds.push_back(*parentHg);
            } else {
                stack.push_back(p);
                missing = true;
            }
        }
        if (missing) continue;

        auto manifest = manifests.manifestFor(current);
        if (!manifest) return manifest.error();
        auto recorded = record(current, compute(cs.value(), parentHgIds, manifest.value()));
        if (!recorded) return recorded.error();
        stack.pop_back();
    }
    auto derived = get(id);
    if (!derived) {
        return Error{ErrorCode::InternalError, "hg id missing after derivation", {id.hex()}};
    }
    return *derived;
}

std::optional<HgChangesetId> HgMapping::get(const ChangesetId& id) const {
    std::scoped_lock lock(mtx);
    auto it = forward.find(id);
    if (it == forward.end()) return std::nullopt;
    return it->second;
}

std::optional<ChangesetId> HgMapping::getChangeset(const HgChangesetId& hg) const {
    std::scoped_lock lock(mtx);
    auto it = reverse.find(hg);
    if (it == reverse.end()) return std::nullopt;
    return it->second;
}

}
