#include "util/Sha1Hasher.hpp"

namespace monosync {

namespace {

constexpr uint32_t rotl(uint32_t x, unsigned n) { return (x << n) | (x >> (32 - n)); }

}

void Sha1Hasher::initState() {
    h = {0x67452301u, 0xefcdab89u, 0x98badcfeu, 0x10325476u, 0xc3d2e1f0u};
}

void Sha1Hasher::compress(const uint8_t* block) {
    std::array<uint32_t, 80> w;
    for (size_t t = 0; t < 16; ++t) w[t] = loadBigEndian(block + 4 * t);
    for (size_t t = 16; t < 80; ++t) w[t] = rotl(w[t - 3] ^ w[t - 8] ^ w[t - 14] ^ w[t - 16], 1);

    uint32_t a = h[0], b = h[1], c = h[2], d = h[3], e = h[4];
    for (size_t t = 0; t < 80; ++t) {
        uint32_t f;
        uint32_t k;
        switch (t / 20) {
        case 0: f = (b & c) | (~b & d); k = 0x5a827999u; break;
        case 1: f = b ^ c ^ d; k = 0x6ed9eba1u; break;
        case 2: f = (b & c) | (b & d) | (c & d); k = 0x8f1bbcdcu; break;
        default: f = b ^ c ^ d; k = 0xca62c1d6u; break;
        }
        uint32_t next = rotl(a, 5) + f + e + k + w[t];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = next;
    }
    h[0] += a;
    h[1] += b;
    h[2] += c;
    h[3] += d;
    h[4] += e;
}

void Sha1Hasher::appendState(std::vector<uint8_t>& out) const {
    for (uint32_t word : h) appendBigEndian(out, word);
}

}
