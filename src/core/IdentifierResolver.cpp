#include "core/IdentifierResolver.hpp"

#include <algorithm>
#include <cctype>

#include "util/IHasher.hpp"

namespace monosync {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

Expected<uint64_t> parseGlobalrev(const std::string& s) {
    if (!allDigits(s)) return Error{ErrorCode::InvalidArgs, "globalrev must be a decimal number", {s}};
    try {
        return static_cast<uint64_t>(std::stoull(s));
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, "globalrev out of range", {s}};
    }
}

Error notFound(const ChangesetSpecifier& spec) {
    return Error{ErrorCode::NotFound, "unknown identifier", {describeSpecifier(spec)}};
}

// Overload set for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

const char* identifierKindName(IdentifierKind kind) {
    switch (kind) {
        case IdentifierKind::Bonsai: return "bonsai";
        case IdentifierKind::Hg: return "hg";
        case IdentifierKind::Globalrev: return "globalrev";
        case IdentifierKind::Bookmark: return "bookmark";
    }
    return "unknown";
}

std::optional<IdentifierKind> parseIdentifierKind(const std::string& name) {
    if (name == "bonsai") return IdentifierKind::Bonsai;
    if (name == "hg") return IdentifierKind::Hg;
    if (name == "globalrev") return IdentifierKind::Globalrev;
    if (name == "bookmark") return IdentifierKind::Bookmark;
    return std::nullopt;
}

std::string describeSpecifier(const ChangesetSpecifier& spec) {
    return std::visit(overloaded{
        [](const BonsaiSpec& s) { return "bonsai:" + s.id.hex(); },
        [](const HgSpec& s) { return "hg:" + s.id.hex(); },
        [](const GlobalrevSpec& s) { return "globalrev:" + std::to_string(s.globalrev); },
        [](const BookmarkSpec& s) { return "bookmark:" + s.name; },
    }, spec);
}

Expected<ChangesetSpecifier> IdentifierResolver::parse(const std::string& text) {
    size_t colon = text.find(':');
    if (colon != std::string::npos) {
        auto kind = parseIdentifierKind(text.substr(0, colon));
        if (kind) {
            std::string value = text.substr(colon + 1);
            switch (*kind) {
                case IdentifierKind::Bonsai: {
                    auto id = ChangesetId::fromHex(value);
                    if (!id) return Error{ErrorCode::InvalidArgs, "malformed changeset id", {value}};
                    return ChangesetSpecifier{BonsaiSpec{*id}};
                }
                case IdentifierKind::Hg: {
                    auto id = HgChangesetId::fromHex(value);
                    if (!id) return Error{ErrorCode::InvalidArgs, "malformed hg id", {value}};
                    return ChangesetSpecifier{HgSpec{*id}};
                }
                case IdentifierKind::Globalrev: {
                    auto rev = parseGlobalrev(value);
                    if (!rev) return rev.error();
                    return ChangesetSpecifier{GlobalrevSpec{rev.value()}};
                }
                case IdentifierKind::Bookmark:
                    if (!isValidBookmarkName(value)) {
                        return Error{ErrorCode::InvalidArgs, "invalid bookmark name", {value}};
                    }
                    return ChangesetSpecifier{BookmarkSpec{value}};
            }
        }
    }

    if (auto id = ChangesetId::fromHex(text)) return ChangesetSpecifier{BonsaiSpec{*id}};
    if (auto id = HgChangesetId::fromHex(text)) return ChangesetSpecifier{HgSpec{*id}};
    if (allDigits(text)) {
        auto rev = parseGlobalrev(text);
        if (!rev) return rev.error();
        return ChangesetSpecifier{GlobalrevSpec{rev.value()}};
    }
    if (!isValidBookmarkName(text)) {
        return Error{ErrorCode::InvalidArgs, "not a changeset identifier", {text}};
    }
    return ChangesetSpecifier{BookmarkSpec{text}};
}

Expected<ChangesetId> IdentifierResolver::resolve(const ChangesetSpecifier& spec) const {
    if (auto bonsai = std::get_if<BonsaiSpec>(&spec)) {
        auto present = repo.changesets().exists(bonsai->id);
        if (!present) return present.error();
        if (!present.value()) return notFound(spec);
        return bonsai->id;
    }
    if (auto hg = std::get_if<HgSpec>(&spec)) {
        auto id = repo.hgIds().getChangeset(hg->id);
        if (!id) return notFound(spec);
        return *id;
    }
    if (auto rev = std::get_if<GlobalrevSpec>(&spec)) {
        auto id = repo.globalrevs().getChangeset(rev->globalrev);
        if (!id) return notFound(spec);
        return *id;
    }
    const auto& bookmark = std::get<BookmarkSpec>(spec);
    auto target = repo.bookmark(bookmark.name);
    if (!target) return target.error();
    if (!target.value()) return notFound(spec);
    return *target.value();
}

Expected<ChangesetId> IdentifierResolver::resolve(const std::string& text) const {
    auto spec = parse(text);
    if (!spec) return spec.error();
    return resolve(spec.value());
}

Expected<std::map<IdentifierKind, std::string>> IdentifierResolver::lookup(
    const ChangesetSpecifier& spec, const std::set<IdentifierKind>& kinds) const {
    auto id = resolve(spec);
    if (!id) return id.error();

    std::map<IdentifierKind, std::string> out;
    for (IdentifierKind kind : kinds) {
        switch (kind) {
            case IdentifierKind::Bonsai:
                out[kind] = id.value().hex();
                break;
            case IdentifierKind::Hg: {
                auto hg = repo.hgIdOf(id.value());
                if (!hg) return hg.error();
                out[kind] = hg.value().hex();
                break;
            }
            case IdentifierKind::Globalrev:
                if (auto rev = repo.globalrevs().get(id.value())) {
                    out[kind] = std::to_string(*rev);
                }
                break;
            case IdentifierKind::Bookmark: {
                auto all = repo.bookmarks().list(repo.id(), "");
                if (!all) return all.error();
                std::string names;
                for (const auto& [name, target] : all.value()) {
                    if (target != id.value()) continue;
                    if (!names.empty()) names += ",";
                    names += name;
                }
                if (!names.empty()) out[kind] = names;
                break;
            }
        }
    }
    return out;
}

}
