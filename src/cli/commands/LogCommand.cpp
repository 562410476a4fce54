#include "cli/commands/LogCommand.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "cli/CommandSupport.hpp"
#include "core/Constants.hpp"
#include "core/IdentifierResolver.hpp"
#include "sync/CommitRewriter.hpp"

namespace monosync {

std::string formatTimezone(int32_t offsetSeconds) {
    int64_t magnitude = offsetSeconds < 0 ? -static_cast<int64_t>(offsetSeconds) : offsetSeconds;
    int64_t minutes = magnitude / 60;
    std::ostringstream out;
    out << (offsetSeconds < 0 ? '-' : '+') << std::setfill('0') << std::setw(2) << minutes / 60
        << std::setw(2) << minutes % 60;
    return out.str();
}

/**
 * @brief Execute 'monosync log'
 *
 * Displays first-parent history newest first. For each commit displays:
 *   - Commit id (yellow) and its globalrev if assigned
 *   - Author and date
 *   - The commit it was synced from, for rewritten commits
 *   - Commit message (indented)
 */
Expected<void> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    auto repoName = takeOption(rest, "-r");
    if (!repoName) return repoName.error();
    auto countText = takeOption(rest, "-n");
    if (!countText) return countText.error();
    if (rest.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "log takes at most one commit"};
    }

    size_t maxCommits = Constants::MAX_COMMIT_LOG;
    if (!countText.value().empty()) {
        try {
            maxCommits = static_cast<size_t>(std::stoul(countText.value()));
        } catch (const std::exception&) {
            return Error{ErrorCode::InvalidArgs, "-n expects a number", {countText.value()}};
        }
    }

    auto sync = openContext(ctx);
    if (!sync) return sync.error();
    auto repo = selectRepo(*sync.value(), repoName.value());
    if (!repo) return repo.error();
    Repository& target = *repo.value();

    std::string start = rest.empty() ? "master" : rest.front();
    auto head = IdentifierResolver(target).resolve(start);
    if (!head) {
        if (rest.empty() && head.error().code == ErrorCode::NotFound) {
            std::cout << "`master does not have any commits yet`\n";
            return {};
        }
        return head.error();
    }

    std::optional<ChangesetId> current = head.value();
    size_t count = 0;
    while (current && count < maxCommits) {
        auto cs = target.changesets().get(*current);
        if (!cs) return cs.error();
        const Changeset& commit = cs.value();

        std::cout << "\033[33mcommit " << current->hex() << "\033[0m";
        if (auto rev = target.globalrevs().get(*current)) std::cout << " (globalrev " << *rev << ")";
        std::cout << "\n";
        std::cout << "Author: " << commit.author << "\n";

        std::time_t timestamp = static_cast<std::time_t>(commit.authorTimestamp);
        std::tm* timeinfo = std::gmtime(&timestamp);
        char buffer[80];
        std::strftime(buffer, sizeof(buffer), "%a %b %d %H:%M:%S %Y", timeinfo);
        std::cout << "Date:   " << buffer << " " << formatTimezone(commit.authorTzOffset) << "\n";
        if (auto source = syncSourceOf(commit)) {
            std::cout << "Synced: repo " << source->first << " " << source->second.hex() << "\n";
        }
        std::cout << "\n";

        std::istringstream iss(commit.message);
        std::string line;
        while (std::getline(iss, line)) {
            std::cout << "    " << line << "\n";
        }
        std::cout << "\n";

        if (commit.parents.empty()) {
            current.reset();
        } else {
            current = commit.parents.front();  // first parent only
        }
        ++count;
    }
    return {};
}

}
