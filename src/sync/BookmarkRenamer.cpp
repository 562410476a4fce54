#include "sync/BookmarkRenamer.hpp"

namespace monosync {

BookmarkCorrespondence BookmarkRenamer::resolve(const std::string& smallName) const {
    if (config.isCommonBookmark(smallName)) {
        return BookmarkCorrespondence{smallName, smallName, true};
    }
    return BookmarkCorrespondence{namespacePrefix() + smallName, smallName, false};
}

std::optional<std::string> BookmarkRenamer::toSmall(const std::string& largeName) const {
    if (config.isCommonBookmark(largeName)) return largeName;
    std::string ns = namespacePrefix();
    if (largeName.size() <= ns.size() || largeName.compare(0, ns.size(), ns) != 0) {
        return std::nullopt;
    }
    std::string smallName = largeName.substr(ns.size());
    // A common name under the prefix would collide with the common bookmark itself.
    if (config.isCommonBookmark(smallName)) return std::nullopt;
    return smallName;
}

}
