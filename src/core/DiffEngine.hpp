#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Repository.hpp"
#include "util/Expected.hpp"

namespace monosync {

struct PathDiff {
    enum class Kind { Added, Removed, Modified, Moved, Copied };

    Kind kind{Kind::Modified};
    std::string path;      // path in the target (the removed path for Removed)
    std::string oldPath;   // source of a move or copy
    bool isBinary{false};  // content has a NUL byte
};

/**
 * @brief Path-level difference between two commits
 *
 * Moves and copies come from the copy sources the target commit records
 * against `base`: a copy whose source path no longer exists in the target
 * is a move (reported once, at the new path), any other copy is a copy,
 * including a copy over a path that already existed.
 */
class DiffEngine {
public:
    explicit DiffEngine(Repository& repo) : repo(repo) {}

    /// Changes from `base` (nullopt = empty tree) to `target`, sorted by path
    Expected<std::vector<PathDiff>> diff(const std::optional<ChangesetId>& base, const ChangesetId& target);

    /// Changes a commit made relative to its first parent
    Expected<std::vector<PathDiff>> diffCommit(const ChangesetId& id);

private:
    Repository& repo;

    Expected<bool> isBinary(const ContentId& id) const;
};

const char* diffKindName(PathDiff::Kind kind);

/**
 * @brief One line per change:
 *   "added X", "removed X", "modified X",
 *   "rename from X to Y", "copy from X to Y"
 * with " (binary)" appended for binary content.
 */
std::string formatDiff(const std::vector<PathDiff>& diffs);

}
