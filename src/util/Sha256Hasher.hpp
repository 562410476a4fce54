#pragma once

#include <array>
#include <cstdint>

#include "util/BlockHasher.hpp"

namespace monosync {

/**
 * @brief SHA-256; every native changeset id and content id is one
 */
class Sha256Hasher : public BlockHasher {
public:
    Sha256Hasher() { reset(); }

    const char* name() const override { return "sha256"; }
    size_t digestSize() const override { return 32; }

protected:
    void initState() override;
    void compress(const uint8_t* block) override;
    void appendState(std::vector<uint8_t>& out) const override;

private:
    std::array<uint32_t, 8> h{};
};

}
