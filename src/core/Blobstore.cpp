#include "core/Blobstore.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <vector>

#include "core/Constants.hpp"

#include <zlib.h>

namespace fs = std::filesystem;

namespace monosync {

namespace {
    /**
     * @brief Compress data using zlib deflate
     */
    std::vector<uint8_t> zlibCompress(const std::string& data) {
        z_stream stream{};
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;

        if (deflateInit(&stream, Z_DEFAULT_COMPRESSION) != Z_OK) {
            throw std::runtime_error("zlib deflateInit failed");
        }

        stream.avail_in = static_cast<uInt>(data.size());
        // Some zlib versions have non-const next_in, so we need to cast away const
        stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data.data()));

        std::vector<uint8_t> compressed;
        compressed.resize(deflateBound(&stream, static_cast<uLong>(data.size())));

        stream.avail_out = static_cast<uInt>(compressed.size());
        stream.next_out = compressed.data();

        if (deflate(&stream, Z_FINISH) != Z_STREAM_END) {
            deflateEnd(&stream);
            throw std::runtime_error("zlib deflate failed");
        }

        compressed.resize(stream.total_out);
        deflateEnd(&stream);
        return compressed;
    }

    /**
     * @brief Decompress zlib data
     */
    std::string zlibDecompress(const std::vector<uint8_t>& compressed) {
        z_stream stream{};
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;

        if (inflateInit(&stream) != Z_OK) {
            throw std::runtime_error("zlib inflateInit failed");
        }

        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_in = const_cast<Bytef*>(compressed.data());

        std::string decompressed;
        std::vector<uint8_t> buffer(4096);

        int ret;
        do {
            stream.avail_out = static_cast<uInt>(buffer.size());
            stream.next_out = buffer.data();

            ret = inflate(&stream, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                inflateEnd(&stream);
                throw std::runtime_error("zlib inflate failed");
            }

            size_t have = buffer.size() - stream.avail_out;
            decompressed.append(reinterpret_cast<char*>(buffer.data()), have);
        } while (ret != Z_STREAM_END);

        inflateEnd(&stream);
        return decompressed;
    }

    std::string tempSuffix() {
        static thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);
        std::string out = ".tmp";
        for (int i = 0; i < 8; ++i) out += "0123456789abcdef"[dis(gen)];
        return out;
    }
}

void MemoryBlobstore::put(const std::string& key, const std::string& value) {
    std::scoped_lock lock(mtx);
    blobs.emplace(key, value);
}

std::optional<std::string> MemoryBlobstore::get(const std::string& key) const {
    std::scoped_lock lock(mtx);
    auto it = blobs.find(key);
    if (it == blobs.end()) return std::nullopt;
    return it->second;
}

bool MemoryBlobstore::exists(const std::string& key) const {
    std::scoped_lock lock(mtx);
    return blobs.count(key) != 0;
}

size_t MemoryBlobstore::size() const {
    std::scoped_lock lock(mtx);
    return blobs.size();
}

FileBlobstore::FileBlobstore(const fs::path& root) : rootPath(root) {}

fs::path FileBlobstore::pathFor(const std::string& key) const {
    size_t dot = key.find('.');
    if (dot == std::string::npos || dot == 0) {
        throw std::runtime_error("Invalid blob key: " + key);
    }
    std::string kind = key.substr(0, dot);
    std::string id = key.substr(dot + 1);
    if (id.length() < Constants::OBJECT_DIR_LENGTH + 1 || id.find('/') != std::string::npos) {
        throw std::runtime_error("Invalid blob key: " + key);
    }
    std::string dir = id.substr(0, Constants::OBJECT_DIR_LENGTH);
    std::string file = id.substr(Constants::OBJECT_DIR_LENGTH);
    return rootPath / kind / dir / file;
}

void FileBlobstore::put(const std::string& key, const std::string& value) {
    fs::path objPath = pathFor(key);
    if (fs::exists(objPath)) {
        return;
    }

    std::error_code ec;
    fs::create_directories(objPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Failed to create blob directory: " + ec.message());
    }

    std::vector<uint8_t> compressed = zlibCompress(value);

    fs::path tmpPath = objPath;
    tmpPath += tempSuffix();
    {
        std::ofstream out(tmpPath, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Failed to open blob file for writing: " + key);
        }
        out.write(reinterpret_cast<const char*>(compressed.data()),
                  static_cast<std::streamsize>(compressed.size()));
        out.flush();
        if (!out || !out.good()) {
            out.close();
            fs::remove(tmpPath, ec);
            throw std::runtime_error("Failed to write blob: " + key);
        }
    }

    // Losing a rename race to an identical writer is fine: the bytes match.
    fs::rename(tmpPath, objPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tmpPath, cleanup);
        if (!fs::exists(objPath)) {
            throw std::runtime_error("Failed to publish blob " + key + ": " + ec.message());
        }
    }
}

std::optional<std::string> FileBlobstore::get(const std::string& key) const {
    fs::path objPath = pathFor(key);
    if (!fs::exists(objPath)) {
        return std::nullopt;
    }

    std::ifstream in(objPath, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open blob file for reading: " + key);
    }
    std::vector<uint8_t> compressed((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Error reading blob file: " + key);
    }
    if (compressed.empty()) {
        throw std::runtime_error("Blob file is empty: " + key);
    }
    return zlibDecompress(compressed);
}

bool FileBlobstore::exists(const std::string& key) const {
    return fs::exists(pathFor(key));
}

}
