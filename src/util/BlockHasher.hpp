#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "util/IHasher.hpp"

namespace monosync {

/**
 * @brief Shared buffering and padding for 64-byte block hashes
 *
 * SHA-1 and SHA-256 differ only in their state and compression function;
 * both consume 512-bit blocks and finish with 0x80, zero fill and the
 * big-endian bit length. Subclasses implement compress(), the initial
 * state and the final state serialization.
 */
class BlockHasher : public IHasher {
public:
    static constexpr size_t kBlockSize = 64;

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;

protected:
    virtual void initState() = 0;
    virtual void compress(const uint8_t* block) = 0;
    /// Append the state words to `out` in big-endian order
    virtual void appendState(std::vector<uint8_t>& out) const = 0;

    static uint32_t loadBigEndian(const uint8_t* p);
    static void appendBigEndian(std::vector<uint8_t>& out, uint32_t word);

private:
    std::array<uint8_t, kBlockSize> pending{};
    size_t pendingLen{0};
    uint64_t totalBytes{0};
};

}
