#pragma once

#include <optional>
#include <string>

#include "sync/CommitSyncConfig.hpp"

namespace monosync {

struct BookmarkCorrespondence {
    std::string largeName;
    std::string smallName;
    bool isCommon{false};
};

/**
 * @brief Maps bookmark names between the small and large repositories
 *
 * Common bookmarks keep their name on both sides. Any other small bookmark
 * X is mirrored in the large repository as "<bookmark_prefix>/X". The small
 * repository's names are never rewritten.
 */
class BookmarkRenamer {
public:
    BookmarkRenamer(std::string bookmarkPrefix, SyncVersionConfig config)
        : prefix(std::move(bookmarkPrefix)), config(std::move(config)) {}

    /// Correspondence for a small-repository bookmark name
    BookmarkCorrespondence resolve(const std::string& smallName) const;

    std::string toLarge(const std::string& smallName) const { return resolve(smallName).largeName; }

    /**
     * @brief Small-repository name for a large bookmark
     *
     * std::nullopt for a large bookmark that is neither common nor under the
     * namespace prefix; such bookmarks are invisible to the small repository.
     */
    std::optional<std::string> toSmall(const std::string& largeName) const;

    /// Name prefix (with trailing '/') under which mirrored bookmarks live in the large repository
    std::string namespacePrefix() const { return prefix + "/"; }

private:
    std::string prefix;
    SyncVersionConfig config;
};

}
