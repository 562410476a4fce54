#pragma once

#include <map>
#include <optional>
#include <string>

#include "core/Changeset.hpp"
#include "sync/CommitSyncConfig.hpp"

namespace monosync {

enum class Direction { SmallToLarge, LargeToSmall };

const char* directionName(Direction direction);

/**
 * @brief Maps paths and file changes between the small and large namespaces
 *
 * Small to large: every path p becomes "<prefix>/p".
 * Large to small: only paths strictly below "<prefix>/" are in scope and
 * lose the prefix; everything else (including a file named exactly
 * "<prefix>") is invisible to the small repository.
 *
 * Stateless; safe to call from any thread.
 */
class PathRewriter {
public:
    static std::optional<std::string> rewritePath(const std::string& path, Direction direction,
                                                  const SyncVersionConfig& config);

    /**
     * @brief Rewrite the copy source of one change
     *
     * A copy source that is out of scope is dropped and the change stays a
     * plain modification. The copy source's changeset id is left untouched;
     * the commit rewriter maps it together with the parents.
     */
    static FileChange rewriteFileChange(const FileChange& change, Direction direction,
                                                       const SyncVersionConfig& config);

    /// Rewrite every change, dropping the out-of-scope ones
    static std::map<std::string, FileChange> rewriteFileChanges(const std::map<std::string, FileChange>& changes,
                                                                Direction direction,
                                                                const SyncVersionConfig& config);
};

}
