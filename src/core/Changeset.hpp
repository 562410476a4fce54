#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "util/Expected.hpp"

namespace monosync {

enum class FileType { Regular, Executable, Symlink };

const char* fileTypeName(FileType type);
std::optional<FileType> parseFileType(const std::string& name);

/// Source of a copy or move: the path as it exists in one of the parents
struct CopyFrom {
    std::string path;
    ChangesetId changeset;

    bool operator==(const CopyFrom& o) const { return path == o.path && changeset == o.changeset; }
};

/**
 * @brief Change to a single path within a changeset
 *
 * Either Modified (new content, optionally copied from a parent path) or
 * Deleted. A rename is a Deleted at the old path plus a Modified with
 * copyFrom at the new path in the same changeset.
 */
struct FileChange {
    enum class Kind { Modified, Deleted };

    Kind kind{Kind::Deleted};
    ContentId contentId;                 // empty for Deleted
    uint64_t size{0};
    FileType fileType{FileType::Regular};
    std::optional<CopyFrom> copyFrom;

    static FileChange modified(const ContentId& id, uint64_t size,
                               FileType type = FileType::Regular,
                               std::optional<CopyFrom> copyFrom = std::nullopt);
    static FileChange deleted();

    bool isDeleted() const { return kind == Kind::Deleted; }

    bool operator==(const FileChange& o) const {
        return kind == o.kind && contentId == o.contentId && size == o.size &&
               fileType == o.fileType && copyFrom == o.copyFrom;
    }
    bool operator!=(const FileChange& o) const { return !(*this == o); }
};

/**
 * @brief Immutable, content-addressed commit
 *
 * The id is SHA-256 over "changeset <size>\0" followed by the canonical
 * serialization: parents in order, file changes sorted by path, author,
 * date, message, extras sorted by key. Every variable-length field is length
 * prefixed so no two distinct changesets serialize to the same bytes.
 *
 * Parents: 0 for a root commit, 1 for a normal commit, 2+ for a merge.
 */
struct Changeset {
    std::vector<ChangesetId> parents;
    std::map<std::string, FileChange> fileChanges;
    std::string author;
    int64_t authorTimestamp{0};      // Unix timestamp
    int32_t authorTzOffset{0};       // Seconds east of UTC
    std::string message;
    std::map<std::string, std::string> extras;   // Free-form metadata (bytes)

    /// Canonical serialization (without the "changeset <size>\0" header)
    std::string serialize() const;

    /// Reverse of serialize(); CorruptObject on malformed input
    static Expected<Changeset> parse(const std::string& bytes);

    /// Content address of this changeset
    ChangesetId computeId() const;

    /**
     * @brief Structural validation
     *
     * Rejects: malformed paths (empty, absolute, "." or ".." components),
     * duplicate parents, copy sources that do not name a parent, and a
     * modified file that is also the directory of another modified path.
     */
    Expected<void> verify() const;

    /// Look up an extra by key
    std::optional<std::string> extra(const std::string& key) const;

    /// First line of the message
    std::string shortMessage() const;

    bool isMerge() const { return parents.size() > 1; }
    bool isRoot() const { return parents.empty(); }
};

/// True for "a/b" relative to "a" (directory prefix), or equal paths
bool pathIsPrefixOf(const std::string& prefix, const std::string& path);

/// Validate a repository-relative path
bool isValidPath(const std::string& path);

}
