#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "core/Constants.hpp"
#include "util/IHasher.hpp"

namespace monosync {

using RepositoryId = int32_t;

/**
 * @brief Hex digest tagged with the scheme it belongs to
 *
 * Keeps native changeset ids, file content ids and alternate-system ids
 * from being mixed up at compile time. A default-constructed id is empty
 * and never names a stored object.
 */
template <typename Tag, size_t HexLength>
class TypedId {
public:
    TypedId() = default;
    explicit TypedId(std::string hex) : hex_(std::move(hex)) {}

    /// Parse a hex string, rejecting wrong lengths and non-hex characters
    static std::optional<TypedId> fromHex(const std::string& hex) {
        if (!IHasher::isHex(hex, HexLength)) return std::nullopt;
        return TypedId(hex);
    }

    static constexpr size_t hexLength() { return HexLength; }

    const std::string& hex() const { return hex_; }
    std::string shortHex() const { return hex_.substr(0, Constants::SHORT_ID_LENGTH); }
    bool empty() const { return hex_.empty(); }

    bool operator==(const TypedId& o) const { return hex_ == o.hex_; }
    bool operator!=(const TypedId& o) const { return hex_ != o.hex_; }
    bool operator<(const TypedId& o) const { return hex_ < o.hex_; }

private:
    std::string hex_;
};

template <typename Tag, size_t N>
std::ostream& operator<<(std::ostream& os, const TypedId<Tag, N>& id) {
    return os << id.hex();
}

struct ChangesetIdTag {};
struct ContentIdTag {};
struct HgChangesetIdTag {};

using ChangesetId = TypedId<ChangesetIdTag, Constants::CHANGESET_ID_HEX_LENGTH>;
using ContentId = TypedId<ContentIdTag, Constants::CHANGESET_ID_HEX_LENGTH>;
using HgChangesetId = TypedId<HgChangesetIdTag, Constants::HG_ID_HEX_LENGTH>;

}

namespace std {
template <typename Tag, size_t N>
struct hash<monosync::TypedId<Tag, N>> {
    size_t operator()(const monosync::TypedId<Tag, N>& id) const noexcept {
        return std::hash<std::string>()(id.hex());
    }
};
}
