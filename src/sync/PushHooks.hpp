#pragma once

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "core/Changeset.hpp"
#include "sync/CommitSyncConfig.hpp"
#include "util/Expected.hpp"

namespace monosync {

/// One changed path as a hook sees it
struct HookFile {
    std::string path;
    bool deleted{false};
    uint64_t size{0};
};

/// A pushed changeset as a hook sees it
struct HookChangeset {
    std::string repoName;
    ChangesetId id;
    std::string author;
    std::string comments;
    std::vector<ChangesetId> parents;
    std::vector<HookFile> files;

    static HookChangeset from(const std::string& repoName, const ChangesetId& id, const Changeset& cs);
};

/// Outcome of one hook on one changeset or file
struct HookExecution {
    bool accepted{true};
    std::string description;
    std::string longDescription;

    static HookExecution accept() { return HookExecution{}; }
    static HookExecution reject(std::string description, std::string longDescription = "") {
        return HookExecution{false, std::move(description), std::move(longDescription)};
    }
};

/**
 * @brief Hook run once per pushed changeset
 *
 * An error return means the hook itself failed; a rejected
 * HookExecution means the changeset is not allowed.
 */
class IChangesetHook {
public:
    virtual ~IChangesetHook() = default;

    virtual const char* name() const = 0;
    virtual Expected<HookExecution> run(const HookChangeset& changeset) = 0;
};

/// Hook run once per changed file of a pushed changeset
class IFileHook {
public:
    virtual ~IFileHook() = default;

    virtual const char* name() const = 0;
    virtual Expected<HookExecution> run(const HookChangeset& changeset, const HookFile& file) = 0;
};

/// Rejects writes (not deletions) to paths matching any of the globs
class BlockedPathsHook : public IFileHook {
public:
    explicit BlockedPathsHook(std::vector<std::string> patterns);

    const char* name() const override { return "blocked-paths"; }
    Expected<HookExecution> run(const HookChangeset& changeset, const HookFile& file) override;

private:
    std::vector<std::string> patterns;
    std::vector<std::regex> compiled;
};

/// Rejects files larger than `limit` bytes
class MaxFileSizeHook : public IFileHook {
public:
    explicit MaxFileSizeHook(uint64_t limit) : limit(limit) {}

    const char* name() const override { return "max-file-size"; }
    Expected<HookExecution> run(const HookChangeset& changeset, const HookFile& file) override;

private:
    uint64_t limit;
};

/// Rejects changesets whose message is empty or only whitespace
class RequireMessageHook : public IChangesetHook {
public:
    const char* name() const override { return "require-message"; }
    Expected<HookExecution> run(const HookChangeset& changeset) override;
};

/**
 * @brief Runs every registered hook over a pushed batch
 *
 * All hooks see all changesets so one push reports every rejection at
 * once. Rejections come back as a single HookRejected error with one
 * "<hook> <short id>: <description>" detail each; a hook that fails
 * outright aborts the check with its own error.
 */
class HookManager {
public:
    explicit HookManager(std::string repoName) : repoName(std::move(repoName)) {}

    /// Manager holding the built-in hooks enabled in `config`
    static HookManager fromConfig(const std::string& repoName, const HookConfig& config);

    void addChangesetHook(std::unique_ptr<IChangesetHook> hook) { changesetHooks.push_back(std::move(hook)); }
    void addFileHook(std::unique_ptr<IFileHook> hook) { fileHooks.push_back(std::move(hook)); }

    bool empty() const { return changesetHooks.empty() && fileHooks.empty(); }

    Expected<void> check(const std::vector<std::pair<ChangesetId, Changeset>>& changesets);

private:
    std::string repoName;
    std::vector<std::unique_ptr<IChangesetHook>> changesetHooks;
    std::vector<std::unique_ptr<IFileHook>> fileHooks;
};

}
