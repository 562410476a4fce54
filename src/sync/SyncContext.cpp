#include "sync/SyncContext.hpp"

#include <fstream>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace monosync {

SyncContext::SyncContext(std::unique_ptr<CommitSyncConfigStore> configs, std::shared_ptr<BookmarkStore> bookmarks,
                         std::unique_ptr<Repository> small, std::unique_ptr<Repository> large,
                         std::unique_ptr<SyncedCommitMapping> mapping)
    : configStore(std::move(configs)),
      bookmarkStore(std::move(bookmarks)),
      smallRepo(std::move(small)),
      largeRepo(std::move(large)),
      syncedMapping(std::move(mapping)),
      commitSyncer(std::make_unique<CommitSyncer>(*smallRepo, *largeRepo, *syncedMapping, *configStore)),
      pushRedirector(std::make_unique<PushRedirector>(*smallRepo, *largeRepo, *commitSyncer, *configStore)) {}

Expected<std::unique_ptr<SyncContext>> SyncContext::inMemory(const CommitSyncConfig& config) {
    auto valid = config.validate();
    if (!valid) return valid.error();
    auto bookmarks = std::make_shared<InMemoryBookmarkStore>();
    return std::make_unique<SyncContext>(
        std::make_unique<CommitSyncConfigStore>(config), bookmarks,
        Repository::inMemory(config.smallRepo.id, config.smallRepo.name, bookmarks),
        Repository::inMemory(config.largeRepo.id, config.largeRepo.name, bookmarks),
        std::make_unique<SyncedCommitMapping>());
}

Expected<std::unique_ptr<SyncContext>> SyncContext::openOnDisk(const fs::path& root) {
    fs::path stateDir = root / Constants::STATE_DIR;
    std::error_code ec;
    if (!fs::is_directory(stateDir, ec)) {
        return Error{ErrorCode::NotARepository, "no " + std::string(Constants::STATE_DIR) + " directory",
                     {root.string()}};
    }

    auto configs = CommitSyncConfigStore::load(stateDir / Constants::CONFIG_FILE);
    if (!configs) return configs.error();
    CommitSyncConfig config = configs.value()->snapshot();

    auto bookmarks = std::make_shared<FileBookmarkStore>(stateDir / "bookmarks");
    auto small = Repository::openOnDisk(config.smallRepo.id, config.smallRepo.name,
                                        stateDir / "repos" / config.smallRepo.name, bookmarks);
    if (!small) return small.error();
    auto large = Repository::openOnDisk(config.largeRepo.id, config.largeRepo.name,
                                        stateDir / "repos" / config.largeRepo.name, bookmarks);
    if (!large) return large.error();
    auto mapping = SyncedCommitMapping::open(stateDir / Constants::MAPPING_FILE);
    if (!mapping) return mapping.error();

    Logger::instance().debug("opened " + stateDir.string());
    return std::make_unique<SyncContext>(std::move(configs.value()), bookmarks, std::move(small.value()),
                                         std::move(large.value()), std::move(mapping.value()));
}

Expected<std::unique_ptr<SyncContext>> SyncContext::initOnDisk(const fs::path& root, const std::string& configText) {
    fs::path stateDir = fs::absolute(root) / Constants::STATE_DIR;
    if (fs::exists(stateDir)) {
        return Error{ErrorCode::AlreadyInitialized, std::string(Constants::STATE_DIR) + " already exists"};
    }
    auto config = CommitSyncConfig::parse(configText);
    if (!config) return config.error();

    std::error_code ec;
    fs::create_directories(stateDir / "bookmarks", ec);
    if (ec) return Error{ErrorCode::IoError, std::string("Failed to create directories: ") + ec.message()};
    fs::create_directories(stateDir / "repos", ec);
    if (ec) return Error{ErrorCode::IoError, std::string("Failed to create directories: ") + ec.message()};

    CommitSyncConfigStore store(config.value(), stateDir / Constants::CONFIG_FILE);
    auto saved = store.save();
    if (!saved) return saved.error();
    return openOnDisk(fs::absolute(root));
}

Repository* SyncContext::repo(const std::string& name) {
    if (name == smallRepo->name()) return smallRepo.get();
    if (name == largeRepo->name()) return largeRepo.get();
    return nullptr;
}

PushrebaseParams SyncContext::pushrebaseParams() const {
    return PushrebaseParams{configStore->snapshot().maxPushrebaseRetries};
}

}
