#include "core/DiffEngine.hpp"

#include <algorithm>
#include <set>

namespace monosync {

const char* diffKindName(PathDiff::Kind kind) {
    switch (kind) {
        case PathDiff::Kind::Added: return "added";
        case PathDiff::Kind::Removed: return "removed";
        case PathDiff::Kind::Modified: return "modified";
        case PathDiff::Kind::Moved: return "rename";
        case PathDiff::Kind::Copied: return "copy";
    }
    return "unknown";
}

Expected<bool> DiffEngine::isBinary(const ContentId& id) const {
    auto content = repo.changesets().getContent(id);
    if (!content) return content.error();
    return content.value().find('\0') != std::string::npos;
}

Expected<std::vector<PathDiff>> DiffEngine::diff(const std::optional<ChangesetId>& base, const ChangesetId& target) {
    Manifest before;
    if (base) {
        auto m = repo.manifests().manifestFor(*base);
        if (!m) return m.error();
        before = std::move(m.value());
    }
    auto after = repo.manifests().manifestFor(target);
    if (!after) return after.error();
    auto targetCs = repo.changesets().get(target);
    if (!targetCs) return targetCs.error();

    std::set<std::string> movedAway;
    std::vector<PathDiff> out;
    for (const auto& [path, entry] : after.value()) {
        auto old = before.find(path);
        auto change = targetCs.value().fileChanges.find(path);
        // A copy recorded against `base` is reported even over an existing or identical file
        const bool copied = base && change != targetCs.value().fileChanges.end() && change->second.copyFrom &&
                            change->second.copyFrom->changeset == *base;
        if (!copied && old != before.end() && old->second == entry) continue;

        PathDiff d;
        d.path = path;
        if (copied) {
            const std::string& source = change->second.copyFrom->path;
            d.oldPath = source;
            bool sourceGone = before.count(source) && !after.value().count(source);
            if (sourceGone && movedAway.insert(source).second) {
                d.kind = PathDiff::Kind::Moved;
            } else {
                d.kind = PathDiff::Kind::Copied;
            }
        } else {
            d.kind = old == before.end() ? PathDiff::Kind::Added : PathDiff::Kind::Modified;
        }
        auto binary = isBinary(entry.contentId);
        if (!binary) return binary.error();
        d.isBinary = binary.value();
        out.push_back(std::move(d));
    }

    for (const auto& [path, entry] : before) {
        if (after.value().count(path) || movedAway.count(path)) continue;
        PathDiff d;
        d.kind = PathDiff::Kind::Removed;
        d.path = path;
        auto binary = isBinary(entry.contentId);
        if (!binary) return binary.error();
        d.isBinary = binary.value();
        out.push_back(std::move(d));
    }

    std::sort(out.begin(), out.end(), [](const PathDiff& a, const PathDiff& b) { return a.path < b.path; });
    return out;
}

Expected<std::vector<PathDiff>> DiffEngine::diffCommit(const ChangesetId& id) {
    auto parents = repo.changesets().parents(id);
    if (!parents) return parents.error();
    std::optional<ChangesetId> base;
    if (!parents.value().empty()) base = parents.value().front();
    return diff(base, id);
}

std::string formatDiff(const std::vector<PathDiff>& diffs) {
    std::string out;
    for (const auto& d : diffs) {
        switch (d.kind) {
            case PathDiff::Kind::Moved:
                out += "rename from " + d.oldPath + " to " + d.path;
                break;
            case PathDiff::Kind::Copied:
                out += "copy from " + d.oldPath + " to " + d.path;
                break;
            default:
                out += std::string(diffKindName(d.kind)) + " " + d.path;
                break;
        }
        if (d.isBinary) out += " (binary)";
        out += "\n";
    }
    return out;
}

}
