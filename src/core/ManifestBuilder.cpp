#include "core/ManifestBuilder.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "core/Constants.hpp"
#include "util/IHasher.hpp"

namespace monosync {

namespace {

std::string manifestKey(const ChangesetId& id) {
    return std::string(Constants::KEY_MANIFEST) + "." + id.hex();
}

void eraseUnder(Manifest& manifest, const std::string& dir) {
    std::string prefix = dir + "/";
    auto it = manifest.lower_bound(prefix);
    while (it != manifest.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = manifest.erase(it);
    }
}

}

Manifest ManifestBuilder::apply(const Manifest& base, const std::map<std::string, FileChange>& changes) {
    Manifest out = base;
    for (const auto& [path, change] : changes) {
        if (change.isDeleted()) {
            out.erase(path);
            continue;
        }
        // A file replaces any directory of the same name, and vice versa.
        eraseUnder(out, path);
        for (size_t slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
            out.erase(path.substr(0, slash));
        }
        out[path] = ManifestEntry{change.contentId, change.fileType, change.size};
    }
    return out;
}

std::string ManifestBuilder::serialize(const Manifest& manifest) {
    std::string out;
    for (const auto& [path, entry] : manifest) {
        out += path;
        out += '\t';
        out += entry.contentId.hex();
        out += '\t';
        out += fileTypeName(entry.fileType);
        out += '\t';
        out += std::to_string(entry.size);
        out += '\n';
    }
    return out;
}

Expected<Manifest> ManifestBuilder::parse(const std::string& bytes) {
    Manifest manifest;
    std::istringstream iss(bytes);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty()) continue;
        // TSV: path\tcontent\ttype\tsize
        std::istringstream fields(line);
        std::string path, content, type, sizeStr;
        if (!std::getline(fields, path, '\t') || !std::getline(fields, content, '\t') ||
            !std::getline(fields, type, '\t') || !std::getline(fields, sizeStr)) {
            return Error{ErrorCode::CorruptObject, "malformed manifest line", {line}};
        }
        auto contentId = ContentId::fromHex(content);
        auto fileType = parseFileType(type);
        if (!contentId || !fileType) {
            return Error{ErrorCode::CorruptObject, "malformed manifest entry", {line}};
        }
        uint64_t size = 0;
        try {
            size = std::stoull(sizeStr);
        } catch (const std::exception&) {
            return Error{ErrorCode::CorruptObject, "malformed manifest size", {line}};
        }
        manifest[path] = ManifestEntry{*contentId, *fileType, size};
    }
    return manifest;
}

Expected<bool> ManifestBuilder::cached(const ChangesetId& id, Manifest* out) {
    std::optional<std::string> bytes;
    try {
        bytes = store.blobstore().get(manifestKey(id));
    } catch (const std::exception& e) {
        return Error{ErrorCode::IoError, std::string("blobstore failure: ") + e.what()};
    }
    if (!bytes) return false;
    if (out) {
        auto parsed = parse(*bytes);
        if (!parsed) return parsed.error();
        *out = std::move(parsed.value());
    }
    return true;
}

bool ManifestBuilder::conflictsWithTree(const Manifest& tree, const std::string& path) {
    if (tree.count(path) != 0) return true;
    // A file at one of the parent directories
    for (size_t slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
        if (tree.count(path.substr(0, slash)) != 0) return true;
    }
    // Files below the path, which would make it a directory
    std::string dir = path + "/";
    auto below = tree.lower_bound(dir);
    return below != tree.end() && below->first.compare(0, dir.size(), dir) == 0;
}

Expected<void> ManifestBuilder::derive(const ChangesetId& id, const std::vector<Manifest>& parents) {
    auto cs = store.get(id);
    if (!cs) return cs.error();

    Manifest base;
    if (!parents.empty()) {
        base = parents.front();
        for (size_t i = 1; i < parents.size(); ++i) {
            for (const auto& [path, entry] : parents[i]) {
                if (conflictsWithTree(base, path)) continue;
                base.emplace(path, entry);
            }
        }
    }
    Manifest result = apply(base, cs.value().fileChanges);
    try {
        store.blobstore().put(manifestKey(id), serialize(result));
    } catch (const std::exception& e) {
        return Error{ErrorCode::IoError, std::string("blobstore failure: ") + e.what()};
    }
    return {};
}

Expected<Manifest> ManifestBuilder::manifestFor(const ChangesetId& id) {
    Manifest result;
    auto hit = cached(id, &result);
    if (!hit) return hit.error();
    if (hit.value()) return result;

    // Post-order over unmanifested ancestors with an explicit stack.
    std::vector<ChangesetId> stack{id};
    std::set<ChangesetId> expanded;
    while (!stack.empty()) {
        ChangesetId current = stack.back();
        auto done = cached(current, nullptr);
        if (!done) return done.error();
        if (done.value()) {
            stack.pop_back();
            continue;
        }

        auto ps = store.parents(current);
        if (!ps) return ps.error();

        if (expanded.insert(current).second) {
            bool missing = false;
            for (const auto& p : ps.value()) {
                auto parentDone = cached(p, nullptr);
                if (!parentDone) return parentDone.error();
                if (!parentDone.value()) {
                    stack.push_back(p);
                    missing = true;
                }
            }
            if (missing) continue;
        }

        std::vector<Manifest> parentManifests;
        for (const auto& p : ps.value()) {
            Manifest m;
            auto got = cached(p, &m);
            if (!got) return got.error();
            if (!got.value()) {
                return Error{ErrorCode::InternalError, "parent manifest missing after derivation", {p.hex()}};
            }
            parentManifests.push_back(std::move(m));
        }
        auto derived = derive(current, parentManifests);
        if (!derived) return derived.error();
        stack.pop_back();
    }

    auto derivedHit = cached(id, &result);
    if (!derivedHit) return derivedHit.error();
    return result;
}

std::string ManifestBuilder::treeDigest(const Manifest& manifest, IHasher& hasher) {
    std::vector<std::pair<std::string, const ManifestEntry*>> entries;
    entries.reserve(manifest.size());
    for (const auto& [path, entry] : manifest) {
        entries.emplace_back(path, &entry);
    }
    return treeDigestOf("", entries, hasher);
}

std::string ManifestBuilder::treeDigestOf(
    const std::string& dirPath,
    const std::vector<std::pair<std::string, const ManifestEntry*>>& entries,
    IHasher& hasher
) {
    // Group entries into direct children: files here, and one bucket per subdir.
    std::string prefix = dirPath.empty() ? "" : dirPath + "/";
    std::map<std::string, const ManifestEntry*> files;
    std::map<std::string, std::vector<std::pair<std::string, const ManifestEntry*>>> subdirs;

    for (const auto& item : entries) {
        std::string relPath = item.first.substr(prefix.length());
        size_t slashPos = relPath.find('/');
        if (slashPos == std::string::npos) {
            files[relPath] = item.second;
        } else {
            subdirs[relPath.substr(0, slashPos)].push_back(item);
        }
    }

    std::map<std::string, std::string> lines;
    for (const auto& [name, entry] : files) {
        lines[name] = std::string(fileTypeName(entry->fileType)) + " " + name + '\0' + entry->contentId.hex() + "\n";
    }
    for (const auto& [name, children] : subdirs) {
        std::string childDigest = treeDigestOf(prefix + name, children, hasher);
        lines[name] = "tree " + name + '\0' + childDigest + "\n";
    }

    hasher.reset();
    for (const auto& kv : lines) {
        hasher.update(kv.second);
    }
    return hasher.hexDigest();
}

}
