#include "util/IHasher.hpp"
#include "util/Sha1Hasher.hpp"
#include "util/Sha256Hasher.hpp"

namespace monosync {

std::string IHasher::toHex(const std::vector<uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[2*i] = hex[(bytes[i] >> 4) & 0xF];
        out[2*i+1] = hex[bytes[i] & 0xF];
    }
    return out;
}

bool IHasher::isHex(const std::string& text, size_t len) {
    if (text.size() != len) return false;
    for (char c : text) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

std::unique_ptr<IHasher> HasherFactory::createDefault() {
    return std::make_unique<Sha256Hasher>();
}

std::unique_ptr<IHasher> HasherFactory::createAlternate() {
    return std::make_unique<Sha1Hasher>();
}

std::unique_ptr<IHasher> HasherFactory::create(const std::string& algorithm) {
    if (algorithm == "sha1") {
        return createAlternate();
    }
    return createDefault();
}

}
