#pragma once

#include <string>
#include <vector>

#include "core/Repository.hpp"
#include "util/Expected.hpp"

namespace monosync {

struct CheckFailure {
    enum class Kind {
        BadChangeset,       // missing, unreadable, or stored bytes do not hash to the id
        InvalidChangeset,   // verify() rejects it
        BadGeneration,      // stored generation disagrees with the parents
        MissingContent,     // a file change names content that is absent or of another size
        HgMappingBroken,    // hg id does not map back to the same changeset
        MissingGlobalrev,   // no globalrev although one is required
        GlobalrevBroken     // globalrev does not map back to the same changeset
    };

    Kind kind;
    ChangesetId id;
    std::string message;
};

const char* checkFailureName(CheckFailure::Kind kind);

/**
 * @brief Offline consistency check of everything reachable from a commit
 *
 * Walks ancestors iteratively and collects every failure instead of
 * stopping at the first one. Store errors that prevent the walk itself are
 * returned as errors.
 */
class RepoChecker {
public:
    struct Options {
        bool requireGlobalrevs{false};
        bool checkContents{true};
    };

    explicit RepoChecker(Repository& repo) : repo(repo) {}

    Expected<std::vector<CheckFailure>> check(const ChangesetId& head, const Options& options);

private:
    Repository& repo;
};

}
