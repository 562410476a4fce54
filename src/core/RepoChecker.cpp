#include "core/RepoChecker.hpp"

#include <algorithm>
#include <unordered_set>

#include "util/Logger.hpp"

namespace monosync {

const char* checkFailureName(CheckFailure::Kind kind) {
    switch (kind) {
        case CheckFailure::Kind::BadChangeset: return "bad-changeset";
        case CheckFailure::Kind::InvalidChangeset: return "invalid-changeset";
        case CheckFailure::Kind::BadGeneration: return "bad-generation";
        case CheckFailure::Kind::MissingContent: return "missing-content";
        case CheckFailure::Kind::HgMappingBroken: return "hg-mapping-broken";
        case CheckFailure::Kind::MissingGlobalrev: return "missing-globalrev";
        case CheckFailure::Kind::GlobalrevBroken: return "globalrev-broken";
    }
    return "unknown";
}

Expected<std::vector<CheckFailure>> RepoChecker::check(const ChangesetId& head, const Options& options) {
    std::vector<CheckFailure> failures;
    std::unordered_set<ChangesetId> seen{head};
    std::vector<ChangesetId> stack{head};
    size_t checked = 0;

    while (!stack.empty()) {
        ChangesetId id = stack.back();
        stack.pop_back();
        ++checked;

        auto cs = repo.changesets().get(id);
        if (!cs) {
            if (cs.error().code == ErrorCode::IoError) return cs.error();
            failures.push_back({CheckFailure::Kind::BadChangeset, id, cs.error().describe()});
            continue;
        }
        for (const auto& p : cs.value().parents) {
            if (seen.insert(p).second) stack.push_back(p);
        }

        auto valid = cs.value().verify();
        if (!valid) {
            failures.push_back({CheckFailure::Kind::InvalidChangeset, id, valid.error().describe()});
        }

        uint64_t expectedGen = 1;
        bool parentsKnown = true;
        for (const auto& p : cs.value().parents) {
            auto pg = repo.changesets().generation(p);
            if (!pg) {
                parentsKnown = false;
                break;
            }
            expectedGen = std::max(expectedGen, pg.value() + 1);
        }
        auto gen = repo.changesets().generation(id);
        if (!gen) {
            failures.push_back({CheckFailure::Kind::BadGeneration, id, gen.error().describe()});
        } else if (parentsKnown && gen.value() != expectedGen) {
            failures.push_back({CheckFailure::Kind::BadGeneration, id,
                                "stored " + std::to_string(gen.value()) + ", expected " + std::to_string(expectedGen)});
        }

        if (options.checkContents) {
            for (const auto& [path, change] : cs.value().fileChanges) {
                if (change.isDeleted()) continue;
                auto content = repo.changesets().getContent(change.contentId);
                if (!content) {
                    failures.push_back({CheckFailure::Kind::MissingContent, id, path + ": " + content.error().describe()});
                } else if (content.value().size() != change.size ||
                           ChangesetStore::contentIdOf(content.value()) != change.contentId) {
                    failures.push_back({CheckFailure::Kind::MissingContent, id, path + ": content does not match"});
                }
            }
        }

        if (auto hg = repo.hgIds().get(id)) {
            auto back = repo.hgIds().getChangeset(*hg);
            if (!back || *back != id) {
                failures.push_back({CheckFailure::Kind::HgMappingBroken, id, "hg id " + hg->hex() + " does not map back"});
            }
        }

        auto rev = repo.globalrevs().get(id);
        if (rev) {
            auto back = repo.globalrevs().getChangeset(*rev);
            if (!back || *back != id) {
                failures.push_back({CheckFailure::Kind::GlobalrevBroken, id,
                                    "globalrev " + std::to_string(*rev) + " does not map back"});
            }
        } else if (options.requireGlobalrevs) {
            failures.push_back({CheckFailure::Kind::MissingGlobalrev, id, "no globalrev assigned"});
        }
    }

    Logger::instance().info("checked " + std::to_string(checked) + " changeset(s), " +
                            std::to_string(failures.size()) + " failure(s)");
    return failures;
}

}
