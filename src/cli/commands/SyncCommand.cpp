#include "cli/commands/SyncCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/IdentifierResolver.hpp"

namespace monosync {

Expected<void> SyncCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto recoverBookmark = takeOption(rest, "--recover");
    if (!recoverBookmark) return recoverBookmark.error();
    bool toLarge = takeFlag(rest, "--to-large");
    bool toSmall = takeFlag(rest, "--to-small");
    if (toLarge && toSmall) {
        return Error{ErrorCode::InvalidArgs, "--to-large and --to-small are mutually exclusive"};
    }

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    SyncContext& pair = *sync.value();

    if (!recoverBookmark.value().empty()) {
        if (!rest.empty() || toLarge || toSmall) {
            return Error{ErrorCode::InvalidArgs, "--recover takes no other arguments"};
        }
        auto recovered = pair.syncer().recover(recoverBookmark.value());
        if (!recovered) return recovered.error();
        std::cout << "recovered " << recovered.value() << " mapping(s) from " << pair.large().name() << "/"
                  << recoverBookmark.value() << "\n";
        return {};
    }

    if (rest.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "sync requires exactly one commit"};
    }
    Direction direction = toSmall ? Direction::LargeToSmall : Direction::SmallToLarge;
    Repository& source = pair.syncer().sourceRepo(direction);
    Repository& target = pair.syncer().targetRepo(direction);

    auto id = IdentifierResolver(source).resolve(rest.front());
    if (!id) return id.error();
    auto outcome = pair.syncer().sync(direction, id.value());
    if (!outcome) return outcome.error();

    for (const auto& [from, to] : outcome.value().synced) {
        std::cout << source.name() << " " << from.shortHex() << " -> " << target.name() << " " << to.shortHex()
                  << "\n";
    }
    std::cout << outcome.value().synced.size() << " synced, " << outcome.value().skipped << " skipped\n";
    if (outcome.value().target) {
        std::cout << id.value().hex() << " -> " << outcome.value().target->hex() << "\n";
    } else {
        std::cout << id.value().hex() << " has no counterpart in " << target.name() << "\n";
    }
    return {};
}

}
