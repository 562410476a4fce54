#include "sync/PathRewriter.hpp"

namespace monosync {

const char* directionName(Direction direction) {
    return direction == Direction::SmallToLarge ? "small-to-large" : "large-to-small";
}

std::optional<std::string> PathRewriter::rewritePath(const std::string& path, Direction direction,
                                                     const SyncVersionConfig& config) {
    const std::string& prefix = config.smallRepoPrefix;
    if (direction == Direction::SmallToLarge) {
        return prefix + "/" + path;
    }
    if (path.size() <= prefix.size() + 1 || path.compare(0, prefix.size(), prefix) != 0 ||
        path[prefix.size()] != '/') {
        return std::nullopt;
    }
    return path.substr(prefix.size() + 1);
}

FileChange PathRewriter::rewriteFileChange(const FileChange& change, Direction direction,
                                           const SyncVersionConfig& config) {
    FileChange out = change;
    if (out.copyFrom) {
        auto source = rewritePath(out.copyFrom->path, direction, config);
        if (source) {
            out.copyFrom->path = *source;
        } else {
            out.copyFrom.reset();
        }
    }
    return out;
}

std::map<std::string, FileChange> PathRewriter::rewriteFileChanges(const std::map<std::string, FileChange>& changes,
                                                                   Direction direction,
                                                                   const SyncVersionConfig& config) {
    std::map<std::string, FileChange> out;
    for (const auto& [path, change] : changes) {
        auto target = rewritePath(path, direction, config);
        if (!target) continue;
        out.emplace(*target, rewriteFileChange(change, direction, config));
    }
    return out;
}

}
