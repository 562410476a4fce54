#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Types.hpp"
#include "util/Expected.hpp"

namespace monosync {

using BookmarkList = std::vector<std::pair<std::string, ChangesetId>>;

/**
 * @brief Mutable named pointers to changesets, scoped per repository
 *
 * The only way to move a bookmark is compare-and-swap: the caller states
 * the value it observed (std::nullopt for "does not exist") and the swap
 * succeeds only if that is still the current value. This is the single
 * serialization point for concurrent pushes; nothing else takes a lock
 * across a publish.
 *
 * Store failures come back as IoError. A lost race is not an error:
 * compareAndSwap/remove return false.
 */
class BookmarkStore {
public:
    virtual ~BookmarkStore() = default;

    virtual Expected<std::optional<ChangesetId>> read(RepositoryId repo, const std::string& name) const = 0;

    virtual Expected<bool> compareAndSwap(RepositoryId repo, const std::string& name,
                                          const std::optional<ChangesetId>& expected,
                                          const ChangesetId& newValue) = 0;

    virtual Expected<bool> remove(RepositoryId repo, const std::string& name,
                                  const ChangesetId& expected) = 0;

    /// Bookmarks whose name starts with `prefix`, sorted by name
    virtual Expected<BookmarkList> list(RepositoryId repo, const std::string& prefix) const = 0;
};

/// Bookmark names follow path rules (non-empty, slash separated, no "." or "..") and never end in ".lock"
bool isValidBookmarkName(const std::string& name);

class InMemoryBookmarkStore : public BookmarkStore {
public:
    Expected<std::optional<ChangesetId>> read(RepositoryId repo, const std::string& name) const override;
    Expected<bool> compareAndSwap(RepositoryId repo, const std::string& name,
                                  const std::optional<ChangesetId>& expected,
                                  const ChangesetId& newValue) override;
    Expected<bool> remove(RepositoryId repo, const std::string& name, const ChangesetId& expected) override;
    Expected<BookmarkList> list(RepositoryId repo, const std::string& prefix) const override;

private:
    mutable std::mutex mtx;
    std::map<std::pair<RepositoryId, std::string>, ChangesetId> bookmarks;
};

/**
 * @brief Bookmarks as files: <root>/<repo-id>/<bookmark-name>
 *
 * Each file holds the 64-hex changeset id and a trailing newline and is
 * replaced atomically (write temp file, rename). Compare-and-swap is
 * serialized by a mutex, which covers every writer in this process.
 */
class FileBookmarkStore : public BookmarkStore {
public:
    explicit FileBookmarkStore(const std::filesystem::path& root);

    Expected<std::optional<ChangesetId>> read(RepositoryId repo, const std::string& name) const override;
    Expected<bool> compareAndSwap(RepositoryId repo, const std::string& name,
                                  const std::optional<ChangesetId>& expected,
                                  const ChangesetId& newValue) override;
    Expected<bool> remove(RepositoryId repo, const std::string& name, const ChangesetId& expected) override;
    Expected<BookmarkList> list(RepositoryId repo, const std::string& prefix) const override;

private:
    std::filesystem::path rootPath;
    mutable std::mutex mtx;

    std::filesystem::path refPath(RepositoryId repo, const std::string& name) const;
    Expected<std::optional<ChangesetId>> readLocked(RepositoryId repo, const std::string& name) const;
};

}
