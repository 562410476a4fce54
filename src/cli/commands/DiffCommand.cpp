#include "cli/commands/DiffCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/DiffEngine.hpp"
#include "core/IdentifierResolver.hpp"

namespace monosync {

Expected<void> DiffCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto repoName = takeOption(rest, "-r");
    if (!repoName) return repoName.error();
    if (rest.empty() || rest.size() > 2) {
        return Error{ErrorCode::InvalidArgs, "diff requires one or two commits"};
    }

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    auto repo = selectRepo(*sync.value(), repoName.value());
    if (!repo) return repo.error();

    IdentifierResolver resolver(*repo.value());
    DiffEngine engine(*repo.value());
    auto first = resolver.resolve(rest[0]);
    if (!first) return first.error();

    Expected<std::vector<PathDiff>> diffs = std::vector<PathDiff>{};
    if (rest.size() == 1) {
        diffs = engine.diffCommit(first.value());
    } else {
        auto second = resolver.resolve(rest[1]);
        if (!second) return second.error();
        diffs = engine.diff(first.value(), second.value());
    }
    if (!diffs) return diffs.error();
    std::cout << formatDiff(diffs.value());
    return {};
}

}
