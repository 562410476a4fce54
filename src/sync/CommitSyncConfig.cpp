#include "sync/CommitSyncConfig.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/BookmarkStore.hpp"
#include "core/Changeset.hpp"

namespace fs = std::filesystem;

namespace monosync {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

Error badLine(size_t lineNo, const std::string& what) {
    return Error{ErrorCode::InvalidArgs, "config line " + std::to_string(lineNo) + ": " + what};
}

Expected<SyncRepo> parseRepo(const std::string& value, size_t lineNo) {
    std::istringstream iss(value);
    SyncRepo repo;
    long long id = 0;
    if (!(iss >> id >> repo.name)) {
        return badLine(lineNo, "expected '<id> <name>'");
    }
    std::string extra;
    if (iss >> extra) {
        return badLine(lineNo, "unexpected text after repository name");
    }
    repo.id = static_cast<RepositoryId>(id);
    return repo;
}

}

const char* emptyCommitPolicyName(EmptyCommitPolicy policy) {
    return policy == EmptyCommitPolicy::Emit ? "emit" : "skip";
}

Expected<CommitSyncConfig> CommitSyncConfig::parse(const std::string& text) {
    CommitSyncConfig config;
    SyncVersionConfig* currentVersion = nullptr;

    std::istringstream in(text);
    std::string raw;
    size_t lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        size_t hash = raw.find('#');
        std::string line = trim(hash == std::string::npos ? raw : raw.substr(0, hash));
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return badLine(lineNo, "expected 'key: value'");
        }
        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));

        if (key == "version") {
            ConfigVersion version = 0;
            try {
                version = static_cast<ConfigVersion>(std::stoul(value));
            } catch (const std::exception&) {
                return badLine(lineNo, "version must be a number");
            }
            if (config.versions.count(version)) {
                return badLine(lineNo, "duplicate version " + value);
            }
            currentVersion = &config.versions[version];
            currentVersion->version = version;
            continue;
        }

        if (!currentVersion) {
            if (key == "small_repo" || key == "large_repo") {
                auto repo = parseRepo(value, lineNo);
                if (!repo) return repo.error();
                (key == "small_repo" ? config.smallRepo : config.largeRepo) = repo.value();
            } else if (key == "bookmark_prefix") {
                config.bookmarkPrefix = value;
            } else if (key == "max_pushrebase_retries") {
                try {
                    config.maxPushrebaseRetries = std::stoi(value);
                } catch (const std::exception&) {
                    return badLine(lineNo, "max_pushrebase_retries must be a number");
                }
            } else if (key == "hook_blocked_paths") {
                std::istringstream globs(value);
                std::string glob;
                while (globs >> glob) config.hooks.blockedPaths.push_back(glob);
            } else if (key == "hook_max_file_size") {
                try {
                    size_t used = 0;
                    config.hooks.maxFileSize = std::stoull(value, &used);
                    if (used != value.size() || value[0] == '-') throw std::invalid_argument(value);
                } catch (const std::exception&) {
                    return badLine(lineNo, "hook_max_file_size must be a number of bytes");
                }
            } else if (key == "hook_require_message") {
                if (value != "true" && value != "false") {
                    return badLine(lineNo, "hook_require_message must be 'true' or 'false'");
                }
                config.hooks.requireMessage = value == "true";
            } else {
                return badLine(lineNo, "unknown key '" + key + "'");
            }
            continue;
        }

        if (key == "small_repo_prefix") {
            currentVersion->smallRepoPrefix = value;
        } else if (key == "common_bookmarks") {
            std::istringstream names(value);
            std::string name;
            while (names >> name) currentVersion->commonBookmarks.insert(name);
        } else if (key == "empty_commits") {
            if (value == "skip") {
                currentVersion->emptyCommits = EmptyCommitPolicy::Skip;
            } else if (value == "emit") {
                currentVersion->emptyCommits = EmptyCommitPolicy::Emit;
            } else {
                return badLine(lineNo, "empty_commits must be 'skip' or 'emit'");
            }
        } else {
            return badLine(lineNo, "unknown key '" + key + "' in version block");
        }
    }

    auto valid = config.validate();
    if (!valid) return valid.error();
    return config;
}

std::string CommitSyncConfig::serialize() const {
    std::ostringstream out;
    out << "small_repo: " << smallRepo.id << " " << smallRepo.name << "\n";
    out << "large_repo: " << largeRepo.id << " " << largeRepo.name << "\n";
    out << "bookmark_prefix: " << bookmarkPrefix << "\n";
    out << "max_pushrebase_retries: " << maxPushrebaseRetries << "\n";
    if (!hooks.blockedPaths.empty()) {
        out << "hook_blocked_paths:";
        for (const auto& glob : hooks.blockedPaths) out << " " << glob;
        out << "\n";
    }
    if (hooks.maxFileSize > 0) out << "hook_max_file_size: " << hooks.maxFileSize << "\n";
    if (hooks.requireMessage) out << "hook_require_message: true\n";
    for (const auto& [version, v] : versions) {
        out << "\nversion: " << version << "\n";
        out << "small_repo_prefix: " << v.smallRepoPrefix << "\n";
        out << "common_bookmarks:";
        for (const auto& name : v.commonBookmarks) out << " " << name;
        out << "\n";
        out << "empty_commits: " << emptyCommitPolicyName(v.emptyCommits) << "\n";
    }
    return out.str();
}

Expected<void> CommitSyncConfig::validate() const {
    if (smallRepo.name.empty() || largeRepo.name.empty()) {
        return Error{ErrorCode::InvalidArgs, "config must name small_repo and large_repo"};
    }
    if (smallRepo.id == largeRepo.id || smallRepo.name == largeRepo.name) {
        return Error{ErrorCode::InvalidArgs, "small and large repositories must differ"};
    }
    if (!isValidBookmarkName(bookmarkPrefix)) {
        return Error{ErrorCode::InvalidArgs, "invalid bookmark_prefix", {bookmarkPrefix}};
    }
    if (maxPushrebaseRetries < 1) {
        return Error{ErrorCode::InvalidArgs, "max_pushrebase_retries must be at least 1"};
    }
    if (versions.empty()) {
        return Error{ErrorCode::InvalidArgs, "config has no version block"};
    }
    for (const auto& [version, v] : versions) {
        if (!isValidPath(v.smallRepoPrefix)) {
            return Error{ErrorCode::InvalidArgs, "invalid small_repo_prefix in version " + std::to_string(version),
                         {v.smallRepoPrefix}};
        }
        for (const auto& name : v.commonBookmarks) {
            if (!isValidBookmarkName(name)) {
                return Error{ErrorCode::InvalidArgs, "invalid common bookmark", {name}};
            }
        }
    }
    return {};
}

const SyncVersionConfig* CommitSyncConfig::get(ConfigVersion version) const {
    auto it = versions.find(version);
    return it == versions.end() ? nullptr : &it->second;
}

CommitSyncConfigStore::CommitSyncConfigStore(CommitSyncConfig config, fs::path path)
    : config(std::move(config)), filePath(std::move(path)) {}

Expected<std::unique_ptr<CommitSyncConfigStore>> CommitSyncConfigStore::load(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read config", {path.string()}};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto config = CommitSyncConfig::parse(text);
    if (!config) return config.error();
    return std::make_unique<CommitSyncConfigStore>(std::move(config.value()), path);
}

Expected<void> CommitSyncConfigStore::save() const {
    std::scoped_lock lock(mtx);
    if (filePath.empty()) return {};
    fs::path tmp = filePath;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return Error{ErrorCode::IoError, "Failed to write config", {tmp.string()}};
        out << config.serialize();
        out.flush();
        if (!out || !out.good()) return Error{ErrorCode::IoError, "Failed to write config", {tmp.string()}};
    }
    std::error_code ec;
    fs::rename(tmp, filePath, ec);
    if (ec) return Error{ErrorCode::IoError, "Failed to replace config: " + ec.message()};
    return {};
}

CommitSyncConfig CommitSyncConfigStore::snapshot() const {
    std::scoped_lock lock(mtx);
    return config;
}

SyncVersionConfig CommitSyncConfigStore::current() const {
    std::scoped_lock lock(mtx);
    return config.current();
}

Expected<SyncVersionConfig> CommitSyncConfigStore::get(ConfigVersion version) const {
    std::scoped_lock lock(mtx);
    const SyncVersionConfig* v = config.get(version);
    if (!v) return Error{ErrorCode::NotFound, "unknown config version", {std::to_string(version)}};
    return *v;
}

Expected<void> CommitSyncConfigStore::addVersion(const SyncVersionConfig& version) {
    std::scoped_lock lock(mtx);
    if (version.version <= config.current().version) {
        return Error{ErrorCode::InvalidArgs, "new config version must be greater than the current one",
                     {std::to_string(version.version)}};
    }
    CommitSyncConfig next = config;
    next.versions[version.version] = version;
    auto valid = next.validate();
    if (!valid) return valid.error();
    config = std::move(next);
    return {};
}

}
