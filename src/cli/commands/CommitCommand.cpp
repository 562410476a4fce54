#include "cli/commands/CommitCommand.hpp"

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <map>

#include "cli/CommandSupport.hpp"
#include "sync/Pushrebase.hpp"
#include "util/Logger.hpp"

namespace monosync {

namespace {

struct CommitRequest {
    std::string repo;
    std::string bookmark{"master"};
    std::string message;
    std::string author;
    std::vector<std::pair<std::string, std::string>> writes;   // path, local file
    std::vector<std::string> deletes;
    std::vector<std::pair<std::string, std::string>> copies;   // from, to
    std::vector<std::pair<std::string, std::string>> moves;    // from, to
};

Expected<CommitRequest> parseRequest(const std::vector<std::string>& args) {
    CommitRequest req;
    std::vector<std::string> messages;
    auto need = [&](size_t i, size_t count) -> Expected<void> {
        if (i + count >= args.size()) {
            return Error{ErrorCode::InvalidArgs, args[i] + " requires " + std::to_string(count) +
                                                     (count == 1 ? " value" : " values")};
        }
        return {};
    };
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        size_t arity = 0;
        if (a == "-r" || a == "-b" || a == "-m" || a == "--author" || a == "--delete") {
            arity = 1;
        } else if (a == "--write" || a == "--copy" || a == "--move") {
            arity = 2;
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + a + "'"};
        }
        auto ok = need(i, arity);
        if (!ok) return ok.error();

        if (a == "-r") req.repo = args[i + 1];
        else if (a == "-b") req.bookmark = args[i + 1];
        else if (a == "-m") messages.push_back(args[i + 1]);
        else if (a == "--author") req.author = args[i + 1];
        else if (a == "--delete") req.deletes.push_back(args[i + 1]);
        else if (a == "--write") req.writes.emplace_back(args[i + 1], args[i + 2]);
        else if (a == "--copy") req.copies.emplace_back(args[i + 1], args[i + 2]);
        else req.moves.emplace_back(args[i + 1], args[i + 2]);
        i += arity;
    }

    if (messages.empty()) {
        return Error{ErrorCode::InvalidArgs, "commit requires a message (-m <msg>)"};
    }
    for (size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) req.message += "\n\n";
        req.message += messages[i];
    }
    if (req.author.empty()) {
        const char* user = std::getenv("USER");
        req.author = user ? user : "monosync";
    }
    return req;
}

/// Current content of `path` in `parent`; NotFound if the parent lacks it
Expected<std::pair<std::string, FileType>> contentAt(Repository& repo, const std::optional<ChangesetId>& parent,
                                                     const std::string& path) {
    if (!parent) {
        return Error{ErrorCode::NotFound, "no such path in an empty bookmark", {path}};
    }
    auto manifest = repo.manifests().manifestFor(*parent);
    if (!manifest) return manifest.error();
    auto it = manifest.value().find(path);
    if (it == manifest.value().end()) {
        return Error{ErrorCode::NotFound, "no such path in " + parent->shortHex(), {path}};
    }
    auto bytes = repo.changesets().getContent(it->second.contentId);
    if (!bytes) return bytes.error();
    return std::make_pair(bytes.value(), it->second.fileType);
}

Expected<std::map<std::string, FileWrite>> buildFiles(Repository& repo, const CommitRequest& req,
                                                      const std::optional<ChangesetId>& parent) {
    std::map<std::string, FileWrite> files;
    for (const auto& [path, local] : req.writes) {
        auto bytes = readLocalFile(local);
        if (!bytes) return bytes.error();
        files[path] = FileWrite::write(bytes.value());
    }
    for (const auto& path : req.deletes) {
        files[path] = FileWrite::remove();
    }
    auto addCopy = [&](const std::string& from, const std::string& to, bool removeSource) -> Expected<void> {
        auto source = contentAt(repo, parent, from);
        if (!source) return source.error();
        FileWrite write = FileWrite::copy(source.value().first, from, *parent);
        write.fileType = source.value().second;
        files[to] = write;
        if (removeSource) files[from] = FileWrite::remove();
        return {};
    };
    for (const auto& [from, to] : req.copies) {
        auto ok = addCopy(from, to, false);
        if (!ok) return ok.error();
    }
    for (const auto& [from, to] : req.moves) {
        auto ok = addCopy(from, to, true);
        if (!ok) return ok.error();
    }
    if (files.empty()) {
        return Error{ErrorCode::InvalidArgs, "nothing to commit (use --write, --delete, --copy or --move)"};
    }
    return files;
}

void printOutcome(const std::string& bookmark, const ChangesetId& head, const std::string& message) {
    std::cout << "[" << bookmark << " " << head.shortHex() << "] " << message.substr(0, message.find('\n'))
              << "\n";
}

Expected<void> commitToLarge(SyncContext& sync, const CommitRequest& req, const Changeset& cs) {
    Repository& large = sync.large();
    auto id = large.changesets().put(cs);
    if (!id) return id.error();

    PushrebaseEngine engine(large, sync.pushrebaseParams());
    auto outcome = engine.rebase(req.bookmark, {id.value()});
    if (!outcome) return outcome.error();
    if (outcome.value().published) {
        for (const auto& [pushed, published] : outcome.value().rebased) {
            auto rev = large.globalrevs().assign(published);
            if (!rev) return rev.error();
            auto hg = large.hgIdOf(published);
            if (!hg) return hg.error();
        }
    }
    printOutcome(req.bookmark, outcome.value().newHead, req.message);
    if (outcome.value().retries > 0) {
        std::cout << "  pushrebase retried " << outcome.value().retries << " time(s)\n";
    }
    return {};
}

Expected<void> commitToSmall(SyncContext& sync, const CommitRequest& req, const Changeset& cs) {
    auto result = sync.redirector().push(req.bookmark, {cs});
    if (!result) return result.error();
    const PushResult& r = result.value();
    printOutcome(r.smallBookmark, r.smallHead, req.message);
    std::cout << "  large " << r.largeBookmark << " -> " << r.largeHead.shortHex() << "\n";
    for (const auto& c : r.commits) {
        std::cout << "  " << c.smallPushed.shortHex() << " landed as " << c.large.shortHex();
        if (c.globalrev) std::cout << " (globalrev " << *c.globalrev << ")";
        std::cout << "\n";
    }
    return {};
}

}

/**
 * @brief Execute 'monosync commit'
 *
 * Builds one commit on top of the bookmark's current value and pushes it.
 * The parent is read once; a bookmark that moves in the meantime is
 * handled by pushrebase, which re-parents the commit onto the new head.
 */
Expected<void> CommitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto req = parseRequest(args);
    if (!req) return req.error();

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    auto repo = selectRepo(*sync.value(), req.value().repo);
    if (!repo) return repo.error();
    Repository& target = *repo.value();

    auto parent = target.bookmark(req.value().bookmark);
    if (!parent) return parent.error();
    auto files = buildFiles(target, req.value(), parent.value());
    if (!files) return files.error();

    std::vector<ChangesetId> parents;
    if (parent.value()) parents.push_back(*parent.value());
    auto cs = target.buildCommit(parents, files.value(), req.value().message, req.value().author,
                                 static_cast<int64_t>(std::time(nullptr)));
    if (!cs) return cs.error();

    Logger::instance().debug("commit to " + target.name() + "/" + req.value().bookmark + " with " +
                             std::to_string(files.value().size()) + " file change(s)");
    if (&target == &sync.value()->large()) {
        return commitToLarge(*sync.value(), req.value(), cs.value());
    }
    return commitToSmall(*sync.value(), req.value(), cs.value());
}

}
