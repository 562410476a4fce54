#include "core/Repository.hpp"

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace monosync {

Repository::Repository(RepositoryId id, std::string name, std::shared_ptr<Blobstore> blobs,
                       std::shared_ptr<BookmarkStore> bookmarks,
                       std::unique_ptr<GlobalrevMapping> globalrevs, std::unique_ptr<HgMapping> hgIds)
    : repoId(id),
      repoName(std::move(name)),
      store(std::make_unique<ChangesetStore>(std::move(blobs))),
      bookmarkStore(std::move(bookmarks)),
      manifestBuilder(std::make_unique<ManifestBuilder>(*store)),
      globalrevTable(std::move(globalrevs)),
      hgTable(std::move(hgIds)) {}

std::unique_ptr<Repository> Repository::inMemory(RepositoryId id, const std::string& name,
                                                 std::shared_ptr<BookmarkStore> bookmarks) {
    return std::make_unique<Repository>(id, name, std::make_shared<MemoryBlobstore>(), std::move(bookmarks),
                                        std::make_unique<GlobalrevMapping>(), std::make_unique<HgMapping>());
}

Expected<std::unique_ptr<Repository>> Repository::openOnDisk(RepositoryId id, const std::string& name,
                                                             const fs::path& dir,
                                                             std::shared_ptr<BookmarkStore> bookmarks) {
    auto globalrevs = GlobalrevMapping::open(dir / Constants::GLOBALREV_FILE);
    if (!globalrevs) return globalrevs.error();
    auto hgIds = HgMapping::open(dir / Constants::HG_MAPPING_FILE);
    if (!hgIds) return hgIds.error();
    return std::make_unique<Repository>(id, name, std::make_shared<FileBlobstore>(dir / "objects"),
                                        std::move(bookmarks), std::move(globalrevs.value()),
                                        std::move(hgIds.value()));
}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) {
    fs::path cur = fs::absolute(start);
    std::error_code ec;
    while (true) {
        fs::path sd = cur / Constants::STATE_DIR;
        if (fs::exists(sd, ec) && fs::is_directory(sd, ec)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside a monosync directory (no .monosync found)"};
        }
        cur = cur.parent_path();
    }
}

Expected<std::optional<ChangesetId>> Repository::bookmark(const std::string& name) const {
    return bookmarkStore->read(repoId, name);
}

Expected<HgChangesetId> Repository::hgIdOf(const ChangesetId& id) {
    return hgTable->derive(*store, *manifestBuilder, id);
}

Expected<Changeset> Repository::buildCommit(const std::vector<ChangesetId>& parents,
                                            const std::map<std::string, FileWrite>& files,
                                            const std::string& message, const std::string& author,
                                            int64_t timestamp) {
    Changeset cs;
    cs.parents = parents;
    cs.author = author;
    cs.authorTimestamp = timestamp;
    cs.message = message;
    for (const auto& [path, write] : files) {
        if (!write.content) {
            cs.fileChanges[path] = FileChange::deleted();
            continue;
        }
        auto contentId = store->putContent(*write.content);
        if (!contentId) return contentId.error();
        cs.fileChanges[path] = FileChange::modified(contentId.value(), write.content->size(),
                                                    write.fileType, write.copyFrom);
    }
    return cs;
}

Expected<ChangesetId> Repository::createCommit(const std::vector<ChangesetId>& parents,
                                               const std::map<std::string, FileWrite>& files,
                                               const std::string& message, const std::string& author,
                                               int64_t timestamp) {
    auto cs = buildCommit(parents, files, message, author, timestamp);
    if (!cs) return cs.error();
    return store->put(cs.value());
}

}
