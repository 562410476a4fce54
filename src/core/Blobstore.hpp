#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace monosync {

/**
 * @brief Opaque key/value blob storage
 *
 * Keys have the form "<kind>.<hex>" (see Constants::KEY_*). Values are
 * immutable once written: put() of an existing key with the same bytes is a
 * no-op, and callers never overwrite a key with different bytes because
 * every key is derived from the value's digest.
 *
 * Implementations throw std::runtime_error on storage failures.
 */
class Blobstore {
public:
    virtual ~Blobstore() = default;

    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool exists(const std::string& key) const = 0;
};

/**
 * @brief In-memory blobstore for tests and ephemeral sync contexts
 */
class MemoryBlobstore : public Blobstore {
public:
    void put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) const override;
    bool exists(const std::string& key) const override;

    size_t size() const;

private:
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::string> blobs;
};

/**
 * @brief Filesystem blobstore
 *
 * Storage layout:
 *   <root>/<kind>/<first-2-chars>/<remaining-chars>
 *   Example: key "changeset.ab12..." -> <root>/changeset/ab/12...
 *
 * Compression:
 *   Values are zlib-compressed before writing. Writes go to a temporary
 *   file that is renamed into place, so a reader never observes a partial
 *   blob.
 */
class FileBlobstore : public Blobstore {
public:
    explicit FileBlobstore(const std::filesystem::path& root);

    void put(const std::string& key, const std::string& value) override;
    std::optional<std::string> get(const std::string& key) const override;
    bool exists(const std::string& key) const override;

    const std::filesystem::path& root() const { return rootPath; }

    /// Path for a key; throws std::runtime_error for malformed keys
    std::filesystem::path pathFor(const std::string& key) const;

private:
    std::filesystem::path rootPath;
};

}
