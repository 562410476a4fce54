#include "cli/commands/LookupCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/IdentifierResolver.hpp"

namespace monosync {

Expected<void> LookupCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto repoName = takeOption(rest, "-r");
    if (!repoName) return repoName.error();
    auto kindNames = takeOptions(rest, "--kind");
    if (!kindNames) return kindNames.error();
    if (rest.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "lookup requires exactly one commit"};
    }

    std::set<IdentifierKind> kinds;
    for (const auto& name : kindNames.value()) {
        auto kind = parseIdentifierKind(name);
        if (!kind) {
            return Error{ErrorCode::InvalidArgs, "unknown identifier kind '" + name + "'",
                         {"expected bonsai, hg, globalrev or bookmark"}};
        }
        kinds.insert(*kind);
    }
    bool allKinds = kinds.empty();
    if (allKinds) {
        kinds = {IdentifierKind::Bonsai, IdentifierKind::Hg, IdentifierKind::Globalrev, IdentifierKind::Bookmark};
    }

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    auto repo = selectRepo(*sync.value(), repoName.value());
    if (!repo) return repo.error();

    auto spec = IdentifierResolver::parse(rest.front());
    if (!spec) return spec.error();
    IdentifierResolver resolver(*repo.value());
    auto ids = resolver.lookup(spec.value(), kinds);
    if (!ids) return ids.error();
    for (const auto& [kind, value] : ids.value()) {
        std::cout << identifierKindName(kind) << ": " << value << "\n";
    }
    if (!allKinds) return {};

    // Counterpart in the other repository, newest config version first
    auto id = resolver.resolve(spec.value());
    if (!id) return id.error();
    SyncContext& pair = *sync.value();
    bool isSmall = repo.value() == &pair.small();
    Direction direction = isSmall ? Direction::SmallToLarge : Direction::LargeToSmall;
    CommitSyncConfig config = pair.configs().snapshot();
    for (auto it = config.versions.rbegin(); it != config.versions.rend(); ++it) {
        auto other = pair.syncer().rewriter().mapped(id.value(), direction, it->first);
        if (!other) continue;
        std::cout << (isSmall ? pair.large().name() : pair.small().name()) << ": " << other->hex()
                  << " (version " << it->first << ")\n";
        break;
    }
    return {};
}

}
