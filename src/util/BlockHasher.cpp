#include "util/BlockHasher.hpp"

#include <algorithm>
#include <cstring>

namespace monosync {

void BlockHasher::reset() {
    initState();
    pending.fill(0);
    pendingLen = 0;
    totalBytes = 0;
}

void BlockHasher::update(const uint8_t* data, size_t len) {
    totalBytes += len;
    if (pendingLen > 0) {
        size_t take = std::min(len, kBlockSize - pendingLen);
        std::memcpy(pending.data() + pendingLen, data, take);
        pendingLen += take;
        data += take;
        len -= take;
        if (pendingLen < kBlockSize) return;
        compress(pending.data());
        pendingLen = 0;
    }
    // Whole blocks straight from the input
    for (; len >= kBlockSize; data += kBlockSize, len -= kBlockSize) {
        compress(data);
    }
    if (len > 0) {
        std::memcpy(pending.data(), data, len);
        pendingLen = len;
    }
}

void BlockHasher::update(const std::string& data) {
    update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> BlockHasher::digest() {
    const uint64_t bitLength = totalBytes * 8;

    pending[pendingLen++] = 0x80;
    if (pendingLen > kBlockSize - 8) {
        std::fill(pending.begin() + pendingLen, pending.end(), 0);
        compress(pending.data());
        pendingLen = 0;
    }
    std::fill(pending.begin() + pendingLen, pending.end() - 8, 0);
    for (int i = 0; i < 8; ++i) {
        pending[kBlockSize - 1 - i] = static_cast<uint8_t>(bitLength >> (8 * i));
    }
    compress(pending.data());

    std::vector<uint8_t> out;
    out.reserve(digestSize());
    appendState(out);
    reset();
    return out;
}

uint32_t BlockHasher::loadBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void BlockHasher::appendBigEndian(std::vector<uint8_t>& out, uint32_t word) {
    out.push_back(static_cast<uint8_t>(word >> 24));
    out.push_back(static_cast<uint8_t>(word >> 16));
    out.push_back(static_cast<uint8_t>(word >> 8));
    out.push_back(static_cast<uint8_t>(word));
}

}
