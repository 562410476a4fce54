#include "core/BookmarkStore.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "core/Changeset.hpp"

namespace fs = std::filesystem;

namespace monosync {

namespace {

Error invalidName(const std::string& name) {
    return Error{ErrorCode::InvalidArgs, "invalid bookmark name", {name}};
}

}

bool isValidBookmarkName(const std::string& name) {
    const std::string reserved = ".lock";
    if (name.size() >= reserved.size() &&
        name.compare(name.size() - reserved.size(), reserved.size(), reserved) == 0) {
        return false;
    }
    return isValidPath(name);
}

Expected<std::optional<ChangesetId>> InMemoryBookmarkStore::read(RepositoryId repo, const std::string& name) const {
    std::scoped_lock lock(mtx);
    auto it = bookmarks.find({repo, name});
    if (it == bookmarks.end()) return std::optional<ChangesetId>{};
    return std::optional<ChangesetId>{it->second};
}

Expected<bool> InMemoryBookmarkStore::compareAndSwap(RepositoryId repo, const std::string& name,
                                                     const std::optional<ChangesetId>& expected,
                                                     const ChangesetId& newValue) {
    if (!isValidBookmarkName(name)) return invalidName(name);
    std::scoped_lock lock(mtx);
    auto key = std::make_pair(repo, name);
    auto it = bookmarks.find(key);
    if (expected) {
        if (it == bookmarks.end() || it->second != *expected) return false;
        it->second = newValue;
    } else {
        if (it != bookmarks.end()) return false;
        bookmarks.emplace(key, newValue);
    }
    return true;
}

Expected<bool> InMemoryBookmarkStore::remove(RepositoryId repo, const std::string& name, const ChangesetId& expected) {
    std::scoped_lock lock(mtx);
    auto it = bookmarks.find({repo, name});
    if (it == bookmarks.end() || it->second != expected) return false;
    bookmarks.erase(it);
    return true;
}

Expected<BookmarkList> InMemoryBookmarkStore::list(RepositoryId repo, const std::string& prefix) const {
    std::scoped_lock lock(mtx);
    BookmarkList out;
    for (auto it = bookmarks.lower_bound({repo, prefix}); it != bookmarks.end(); ++it) {
        if (it->first.first != repo || it->first.second.compare(0, prefix.size(), prefix) != 0) break;
        out.emplace_back(it->first.second, it->second);
    }
    return out;
}

FileBookmarkStore::FileBookmarkStore(const fs::path& root) : rootPath(root) {}

fs::path FileBookmarkStore::refPath(RepositoryId repo, const std::string& name) const {
    return rootPath / std::to_string(repo) / name;
}

Expected<std::optional<ChangesetId>> FileBookmarkStore::readLocked(RepositoryId repo, const std::string& name) const {
    fs::path p = refPath(repo, name);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        return std::optional<ChangesetId>{};
    }
    std::ifstream in(p);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read bookmark", {name}};
    }
    std::string hash;
    std::getline(in, hash);
    while (!hash.empty() && std::isspace(static_cast<unsigned char>(hash.back()))) {
        hash.pop_back();
    }
    auto id = ChangesetId::fromHex(hash);
    if (!id) {
        return Error{ErrorCode::CorruptObject, "bookmark file does not hold a changeset id", {name, hash}};
    }
    return std::optional<ChangesetId>{*id};
}

Expected<std::optional<ChangesetId>> FileBookmarkStore::read(RepositoryId repo, const std::string& name) const {
    if (!isValidBookmarkName(name)) return invalidName(name);
    std::scoped_lock lock(mtx);
    return readLocked(repo, name);
}

Expected<bool> FileBookmarkStore::compareAndSwap(RepositoryId repo, const std::string& name,
                                                 const std::optional<ChangesetId>& expected,
                                                 const ChangesetId& newValue) {
    if (!isValidBookmarkName(name)) return invalidName(name);
    std::scoped_lock lock(mtx);
    auto current = readLocked(repo, name);
    if (!current) return current.error();
    if (current.value() != expected) return false;

    fs::path p = refPath(repo, name);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create bookmark directory: " + ec.message()};
    }

    fs::path tmp = p;
    tmp += ".lock";
    {
        std::ofstream rf(tmp, std::ios::binary | std::ios::trunc);
        if (!rf) {
            return Error{ErrorCode::IoError, "Failed to write bookmark", {name}};
        }
        rf << newValue.hex() << "\n";
        rf.flush();
        if (!rf || !rf.good()) {
            return Error{ErrorCode::IoError, "Failed to write bookmark", {name}};
        }
    }
    fs::rename(tmp, p, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to update bookmark: " + ec.message(), {name}};
    }
    return true;
}

Expected<bool> FileBookmarkStore::remove(RepositoryId repo, const std::string& name, const ChangesetId& expected) {
    if (!isValidBookmarkName(name)) return invalidName(name);
    std::scoped_lock lock(mtx);
    auto current = readLocked(repo, name);
    if (!current) return current.error();
    if (!current.value() || *current.value() != expected) return false;

    std::error_code ec;
    fs::remove(refPath(repo, name), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to delete bookmark: " + ec.message(), {name}};
    }
    return true;
}

Expected<BookmarkList> FileBookmarkStore::list(RepositoryId repo, const std::string& prefix) const {
    std::scoped_lock lock(mtx);
    BookmarkList out;
    fs::path repoDir = rootPath / std::to_string(repo);
    std::error_code ec;
    if (!fs::exists(repoDir, ec)) {
        return out;
    }

    for (auto it = fs::recursive_directory_iterator(repoDir, ec);
         it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file()) continue;
        if (it->path().extension() == ".lock") continue;
        std::string name = fs::relative(it->path(), repoDir).generic_string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        auto value = readLocked(repo, name);
        if (!value) return value.error();
        if (value.value()) out.emplace_back(name, *value.value());
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to list bookmarks: " + ec.message()};
    }

    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return out;
}

}
