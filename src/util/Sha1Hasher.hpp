#pragma once

#include <array>
#include <cstdint>

#include "util/BlockHasher.hpp"

namespace monosync {

/**
 * @brief SHA-1, used only for the alternate (Mercurial style) changeset ids
 *
 * Those ids must stay SHA-1 to remain comparable with the ids clients
 * already hold.
 */
class Sha1Hasher : public BlockHasher {
public:
    Sha1Hasher() { reset(); }

    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

protected:
    void initState() override;
    void compress(const uint8_t* block) override;
    void appendState(std::vector<uint8_t>& out) const override;

private:
    std::array<uint32_t, 5> h{};
};

}
