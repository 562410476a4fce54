#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>

#include "core/Repository.hpp"
#include "core/Types.hpp"
#include "util/Expected.hpp"

namespace monosync {

enum class IdentifierKind { Bonsai, Hg, Globalrev, Bookmark };

const char* identifierKindName(IdentifierKind kind);
std::optional<IdentifierKind> parseIdentifierKind(const std::string& name);

struct BonsaiSpec { ChangesetId id; };
struct HgSpec { HgChangesetId id; };
struct GlobalrevSpec { uint64_t globalrev{0}; };
struct BookmarkSpec { std::string name; };

/// Any identifier a commit can be named by
using ChangesetSpecifier = std::variant<BonsaiSpec, HgSpec, GlobalrevSpec, BookmarkSpec>;

std::string describeSpecifier(const ChangesetSpecifier& spec);

/**
 * @brief Resolves every supported identifier scheme to a native changeset id
 *
 * Each scheme is backed by its own index in the repository (changeset
 * store, hg table, globalrev table, bookmark store). Identifiers never need
 * disambiguation: every scheme is unique by construction.
 */
class IdentifierResolver {
public:
    explicit IdentifierResolver(Repository& repo) : repo(repo) {}

    /**
     * @brief Parse user input into a specifier
     *
     * Accepts explicit "bonsai:", "hg:", "globalrev:" and "bookmark:"
     * prefixes. Without a prefix: 64 hex is a native id, 40 hex an hg id,
     * all digits a globalrev, anything else a bookmark name.
     * InvalidArgs for a prefixed value that does not parse.
     */
    static Expected<ChangesetSpecifier> parse(const std::string& text);

    /// Native id for a specifier; NotFound (with the identifier in details) when well-formed but unknown
    Expected<ChangesetId> resolve(const ChangesetSpecifier& spec) const;

    /// parse() then resolve()
    Expected<ChangesetId> resolve(const std::string& text) const;

    /**
     * @brief Every requested scheme that has a value for the commit
     *
     * Hg ids are derived on demand; globalrevs are only reported once
     * assigned; Bookmark lists the bookmarks currently pointing at the
     * commit, comma separated. Schemes without a value are omitted.
     */
    Expected<std::map<IdentifierKind, std::string>> lookup(const ChangesetSpecifier& spec,
                                                           const std::set<IdentifierKind>& kinds) const;

private:
    Repository& repo;
};

}
