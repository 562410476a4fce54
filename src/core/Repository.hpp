#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/BookmarkStore.hpp"
#include "core/Changeset.hpp"
#include "core/ChangesetStore.hpp"
#include "core/GlobalrevMapping.hpp"
#include "core/HgMapping.hpp"
#include "core/ManifestBuilder.hpp"
#include "util/Expected.hpp"

namespace monosync {

/**
 * @brief New content for one path when building a commit by hand
 *
 * std::nullopt content deletes the path.
 */
struct FileWrite {
    std::optional<std::string> content;
    FileType fileType{FileType::Regular};
    std::optional<CopyFrom> copyFrom{};

    static FileWrite write(std::string content, FileType type = FileType::Regular) {
        return FileWrite{std::move(content), type, std::nullopt};
    }
    static FileWrite copy(std::string content, std::string fromPath, const ChangesetId& fromChangeset) {
        return FileWrite{std::move(content), FileType::Regular, CopyFrom{std::move(fromPath), fromChangeset}};
    }
    static FileWrite remove() { return FileWrite{std::nullopt, FileType::Regular, std::nullopt}; }
};

/**
 * @brief One repository: its commits, bookmarks and identifier tables
 *
 * A Repository bundles the services that are scoped to one repository id.
 * The bookmark store may be shared with other repositories (bookmarks are
 * keyed by repository id); everything else is owned.
 *
 * On-disk layout (openOnDisk):
 *   <dir>/objects/       blobstore (changesets, contents, derived data)
 *   <dir>/globalrevs     globalrev table
 *   <dir>/hg_mapping     hg id table
 *
 * Bookmarks live wherever the shared BookmarkStore keeps them.
 */
class Repository {
public:
    Repository(RepositoryId id, std::string name, std::shared_ptr<Blobstore> blobs,
               std::shared_ptr<BookmarkStore> bookmarks,
               std::unique_ptr<GlobalrevMapping> globalrevs, std::unique_ptr<HgMapping> hgIds);

    /// Repository backed entirely by memory
    static std::unique_ptr<Repository> inMemory(RepositoryId id, const std::string& name,
                                                std::shared_ptr<BookmarkStore> bookmarks);

    /// Repository stored under `dir` (created on first write)
    static Expected<std::unique_ptr<Repository>> openOnDisk(RepositoryId id, const std::string& name,
                                                            const std::filesystem::path& dir,
                                                            std::shared_ptr<BookmarkStore> bookmarks);

    /**
     * @brief Find the directory holding .monosync by searching upwards
     * @param start Starting directory (usually current working directory)
     * @return Absolute path of the directory containing .monosync, or NotARepository
     */
    static Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start);

    RepositoryId id() const { return repoId; }
    const std::string& name() const { return repoName; }

    ChangesetStore& changesets() { return *store; }
    const ChangesetStore& changesets() const { return *store; }
    BookmarkStore& bookmarks() { return *bookmarkStore; }
    const BookmarkStore& bookmarks() const { return *bookmarkStore; }
    ManifestBuilder& manifests() { return *manifestBuilder; }
    GlobalrevMapping& globalrevs() { return *globalrevTable; }
    const GlobalrevMapping& globalrevs() const { return *globalrevTable; }
    HgMapping& hgIds() { return *hgTable; }
    const HgMapping& hgIds() const { return *hgTable; }

    /// Current target of a bookmark in this repository
    Expected<std::optional<ChangesetId>> bookmark(const std::string& name) const;

    /// Hg id of a commit, deriving it on first use
    Expected<HgChangesetId> hgIdOf(const ChangesetId& id);

    /**
     * @brief Store file contents and a changeset built from them
     *
     * Convenience for the CLI and tests; the pushed commit is not published
     * to any bookmark.
     */
    Expected<ChangesetId> createCommit(const std::vector<ChangesetId>& parents,
                                       const std::map<std::string, FileWrite>& files,
                                       const std::string& message, const std::string& author,
                                       int64_t timestamp = 0);

    /// Build (but do not store) the changeset createCommit would store
    Expected<Changeset> buildCommit(const std::vector<ChangesetId>& parents,
                                    const std::map<std::string, FileWrite>& files,
                                    const std::string& message, const std::string& author,
                                    int64_t timestamp = 0);

private:
    RepositoryId repoId;
    std::string repoName;
    std::unique_ptr<ChangesetStore> store;
    std::shared_ptr<BookmarkStore> bookmarkStore;
    std::unique_ptr<ManifestBuilder> manifestBuilder;
    std::unique_ptr<GlobalrevMapping> globalrevTable;
    std::unique_ptr<HgMapping> hgTable;
};

}
