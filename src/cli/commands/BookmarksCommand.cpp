#include "cli/commands/BookmarksCommand.hpp"

#include <iostream>
#include <map>

#include "cli/CommandSupport.hpp"
#include "core/IdentifierResolver.hpp"
#include "sync/Pushrebase.hpp"
#include "util/PatternMatcher.hpp"

namespace monosync {

namespace {

Expected<void> deleteLargeBookmark(SyncContext& sync, const std::string& name) {
    auto current = sync.large().bookmark(name);
    if (!current) return current.error();
    if (!current.value()) {
        return Error{ErrorCode::NotFound, "no such bookmark", {sync.large().name() + "/" + name}};
    }
    PushrebaseEngine engine(sync.large(), sync.pushrebaseParams());
    auto removed = engine.deleteBookmark(name, *current.value());
    if (!removed) return removed.error();
    if (!removed.value()) {
        return Error{ErrorCode::TooManyRetries, "bookmark moved while deleting it", {name}};
    }
    return {};
}

}

Expected<void> BookmarksCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto repoName = takeOption(rest, "-r");
    if (!repoName) return repoName.error();
    auto toDelete = takeOption(rest, "--delete");
    if (!toDelete) return toDelete.error();
    bool create = takeFlag(rest, "--create");

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    SyncContext& pair = *sync.value();
    auto repo = selectRepo(pair, repoName.value());
    if (!repo) return repo.error();
    Repository& target = *repo.value();

    if (create) {
        if (rest.size() != 2 || !toDelete.value().empty()) {
            return Error{ErrorCode::InvalidArgs, "--create requires a name and a commit"};
        }
        if (&target != &pair.small()) {
            return Error{ErrorCode::InvalidArgs, "bookmarks are created through the small repository"};
        }
        auto id = IdentifierResolver(target).resolve(rest[1]);
        if (!id) return id.error();
        auto created = pair.redirector().createBookmark(rest[0], id.value());
        if (!created) return created.error();
        std::cout << "created " << rest[0] << " at " << id.value().shortHex() << "\n";
        return {};
    }

    if (!toDelete.value().empty()) {
        if (!rest.empty()) {
            return Error{ErrorCode::InvalidArgs, "--delete takes one bookmark name"};
        }
        auto deleted = &target == &pair.small() ? pair.redirector().deleteBookmark(toDelete.value())
                                                : deleteLargeBookmark(pair, toDelete.value());
        if (!deleted) return deleted.error();
        std::cout << "deleted " << toDelete.value() << "\n";
        return {};
    }

    if (rest.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "bookmarks takes at most one pattern"};
    }
    auto all = target.bookmarks().list(target.id(), "");
    if (!all) return all.error();

    std::map<std::string, ChangesetId> byName(all.value().begin(), all.value().end());
    std::vector<std::string> names;
    for (const auto& kv : byName) names.push_back(kv.first);
    if (!rest.empty()) names = PatternMatcher::matchNames(rest.front(), names);

    for (const auto& name : names) {
        std::cout << "  " << name << "\t" << byName.at(name).hex() << "\n";
    }
    return {};
}

}
