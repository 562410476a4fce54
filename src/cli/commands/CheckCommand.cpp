#include "cli/commands/CheckCommand.hpp"

#include <iostream>

#include "cli/CommandSupport.hpp"
#include "core/IdentifierResolver.hpp"
#include "core/RepoChecker.hpp"

namespace monosync {

Expected<void> CheckCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto repoName = takeOption(rest, "-r");
    if (!repoName) return repoName.error();
    RepoChecker::Options options;
    options.requireGlobalrevs = takeFlag(rest, "--require-globalrevs");
    options.checkContents = !takeFlag(rest, "--skip-contents");
    if (rest.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "check requires exactly one commit"};
    }

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    auto repo = selectRepo(*sync.value(), repoName.value());
    if (!repo) return repo.error();

    auto head = IdentifierResolver(*repo.value()).resolve(rest.front());
    if (!head) return head.error();
    auto failures = RepoChecker(*repo.value()).check(head.value(), options);
    if (!failures) return failures.error();

    if (failures.value().empty()) {
        std::cout << "ok: everything reachable from " << head.value().shortHex() << " is consistent\n";
        return {};
    }
    Error err{ErrorCode::CorruptObject,
              std::to_string(failures.value().size()) + " problem(s) in " + repo.value()->name()};
    for (const auto& f : failures.value()) {
        std::string line = std::string(checkFailureName(f.kind)) + " " + f.id.hex() + ": " + f.message;
        std::cout << line << "\n";
        err.details.push_back(line);
    }
    return err;
}

}
