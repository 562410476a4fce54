#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace monosync {

/**
 * @brief Strategy interface for hash algorithms
 *
 * Native changeset ids and content ids are SHA-256; the alternate
 * (Mercurial style) changeset ids are SHA-1. Callers that only need a
 * digest go through HasherFactory and never name a concrete class.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    /// Reset hasher to initial state
    virtual void reset() = 0;

    /// Update hash with raw bytes
    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Update hash with string
    virtual void update(const std::string& data) = 0;

    /// Finalize and return digest bytes
    virtual std::vector<uint8_t> digest() = 0;

    /// Get hash algorithm name (e.g., "sha1", "sha256")
    virtual const char* name() const = 0;

    /// Get digest size in bytes (20 for SHA-1, 32 for SHA-256)
    virtual size_t digestSize() const = 0;

    /// Finalize and return the lowercase hex digest
    std::string hexDigest() { return toHex(digest()); }

    /// Convert binary hash to lowercase hex string
    static std::string toHex(const std::vector<uint8_t>& bytes);

    /// True if `text` is exactly `len` lowercase hex characters
    static bool isHex(const std::string& text, size_t len);
};

/**
 * @brief Factory for creating hasher instances
 */
class HasherFactory {
public:
    /// Hasher for native changeset and content ids (SHA-256)
    static std::unique_ptr<IHasher> createDefault();

    /// Hasher for alternate-system changeset ids (SHA-1)
    static std::unique_ptr<IHasher> createAlternate();

    /// Create specific hasher by name; unknown names fall back to the default
    static std::unique_ptr<IHasher> create(const std::string& algorithm);
};

}
