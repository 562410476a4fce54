#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/Types.hpp"
#include "util/Expected.hpp"

namespace monosync {

using ConfigVersion = uint32_t;

/// What to do with a commit whose every file change falls outside the target namespace
enum class EmptyCommitPolicy { Skip, Emit };

const char* emptyCommitPolicyName(EmptyCommitPolicy policy);

struct SyncRepo {
    RepositoryId id{0};
    std::string name;
};

/**
 * @brief One version of the small/large mapping
 *
 * The small repository is embedded in the large one under
 * `smallRepoPrefix`. Bookmarks in `commonBookmarks` keep their name in both
 * repositories.
 */
struct SyncVersionConfig {
    ConfigVersion version{0};
    std::string smallRepoPrefix;
    std::set<std::string> commonBookmarks;
    EmptyCommitPolicy emptyCommits{EmptyCommitPolicy::Skip};

    bool isCommonBookmark(const std::string& name) const { return commonBookmarks.count(name) > 0; }
};

/**
 * @brief Checks run on every commit pushed to the small repository
 *
 * All hooks are off by default. Paths are matched in the small
 * repository's namespace with PatternMatcher globs.
 */
struct HookConfig {
    std::vector<std::string> blockedPaths;   // globs no pushed commit may write
    uint64_t maxFileSize{0};                 // bytes; 0 disables the limit
    bool requireMessage{false};              // reject blank commit messages

    bool empty() const { return blockedPaths.empty() && maxFileSize == 0 && !requireMessage; }
};

/**
 * @brief Configuration for one small/large repository pair
 *
 * File format (`.monosync/config`), "key: value" lines, '#' comments:
 *
 *   small_repo: 1 project
 *   large_repo: 0 mono
 *   bookmark_prefix: project
 *   max_pushrebase_retries: 5
 *   hook_blocked_paths: *.pem *.key          (optional)
 *   hook_max_file_size: 1048576              (optional)
 *   hook_require_message: true               (optional)
 *
 *   version: 1
 *   small_repo_prefix: libs/project
 *   common_bookmarks: master release
 *   empty_commits: skip
 *
 * Keys after a "version:" line belong to that version. The highest version
 * is current; older versions stay resolvable for commits synced under them.
 */
struct CommitSyncConfig {
    SyncRepo smallRepo;
    SyncRepo largeRepo;
    std::string bookmarkPrefix;
    int maxPushrebaseRetries{5};
    HookConfig hooks;
    std::map<ConfigVersion, SyncVersionConfig> versions;

    static Expected<CommitSyncConfig> parse(const std::string& text);
    std::string serialize() const;

    /// InvalidArgs for an unusable configuration
    Expected<void> validate() const;

    const SyncVersionConfig& current() const { return versions.rbegin()->second; }
    const SyncVersionConfig* get(ConfigVersion version) const;
};

/**
 * @brief Thread-safe holder of the configuration, optionally backed by a file
 *
 * Readers get a copy of the version they ask for, so a concurrent
 * addVersion() never changes a version that is already in use.
 */
class CommitSyncConfigStore {
public:
    explicit CommitSyncConfigStore(CommitSyncConfig config, std::filesystem::path path = {});

    /// Read and validate a config file
    static Expected<std::unique_ptr<CommitSyncConfigStore>> load(const std::filesystem::path& path);

    /// Write the config back to its file (no-op for an in-memory store)
    Expected<void> save() const;

    CommitSyncConfig snapshot() const;
    SyncVersionConfig current() const;
    Expected<SyncVersionConfig> get(ConfigVersion version) const;

    /// Add a newer version; InvalidArgs if it is not newer than the current one
    Expected<void> addVersion(const SyncVersionConfig& version);

private:
    mutable std::mutex mtx;
    CommitSyncConfig config;
    std::filesystem::path filePath;
};

}
