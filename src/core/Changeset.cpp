#include "core/Changeset.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

#include "util/IHasher.hpp"

namespace monosync {

namespace {

const char* kFormatLine = "changeset v1";

void putSized(std::string& out, const std::string& field) {
    out += std::to_string(field.size());
    out += ':';
    out += field;
}

/**
 * @brief Cursor over a serialized changeset
 *
 * Throws std::runtime_error on any mismatch; Changeset::parse turns that
 * into a CorruptObject error.
 */
class Reader {
public:
    explicit Reader(const std::string& data) : data(data) {}

    void literal(const std::string& text) {
        if (data.compare(pos, text.size(), text) != 0) {
            throw std::runtime_error("expected '" + text + "' at offset " + std::to_string(pos));
        }
        pos += text.size();
    }

    std::string token() {
        size_t end = data.find_first_of(" \n", pos);
        if (end == std::string::npos || end == pos) {
            throw std::runtime_error("truncated token at offset " + std::to_string(pos));
        }
        std::string out = data.substr(pos, end - pos);
        pos = end;
        return out;
    }

    int64_t number() {
        std::string t = token();
        size_t used = 0;
        int64_t value = std::stoll(t, &used);
        if (used != t.size()) throw std::runtime_error("bad number: " + t);
        return value;
    }

    uint64_t count() {
        int64_t value = number();
        if (value < 0) throw std::runtime_error("negative count");
        return static_cast<uint64_t>(value);
    }

    std::string sized() {
        size_t colon = data.find(':', pos);
        if (colon == std::string::npos) throw std::runtime_error("missing length prefix");
        size_t len = std::stoull(data.substr(pos, colon - pos));
        if (colon + 1 + len > data.size()) throw std::runtime_error("field overruns input");
        std::string out = data.substr(colon + 1, len);
        pos = colon + 1 + len;
        return out;
    }

    bool peek(char c) const { return pos < data.size() && data[pos] == c; }
    bool atEnd() const { return pos == data.size(); }

private:
    const std::string& data;
    size_t pos{0};
};

ChangesetId parseChangesetId(const std::string& hex) {
    auto id = ChangesetId::fromHex(hex);
    if (!id) throw std::runtime_error("bad changeset id: " + hex);
    return *id;
}

}

const char* fileTypeName(FileType type) {
    switch (type) {
        case FileType::Regular: return "regular";
        case FileType::Executable: return "exec";
        case FileType::Symlink: return "symlink";
    }
    return "regular";
}

std::optional<FileType> parseFileType(const std::string& name) {
    if (name == "regular") return FileType::Regular;
    if (name == "exec") return FileType::Executable;
    if (name == "symlink") return FileType::Symlink;
    return std::nullopt;
}

FileChange FileChange::modified(const ContentId& id, uint64_t size, FileType type,
                                std::optional<CopyFrom> copyFrom) {
    FileChange fc;
    fc.kind = Kind::Modified;
    fc.contentId = id;
    fc.size = size;
    fc.fileType = type;
    fc.copyFrom = std::move(copyFrom);
    return fc;
}

FileChange FileChange::deleted() {
    return FileChange{};
}

std::string Changeset::serialize() const {
    std::string out = kFormatLine;
    out += '\n';

    out += "parents " + std::to_string(parents.size()) + "\n";
    for (const auto& p : parents) {
        out += p.hex();
        out += '\n';
    }

    // std::map keeps file changes sorted by path
    out += "files " + std::to_string(fileChanges.size()) + "\n";
    for (const auto& [path, change] : fileChanges) {
        if (change.isDeleted()) {
            out += "D ";
            putSized(out, path);
        } else {
            out += "M ";
            putSized(out, path);
            out += ' ' + change.contentId.hex();
            out += ' ' + std::to_string(change.size);
            out += ' ';
            out += fileTypeName(change.fileType);
            if (change.copyFrom) {
                out += " C ";
                putSized(out, change.copyFrom->path);
                out += ' ' + change.copyFrom->changeset.hex();
            }
        }
        out += '\n';
    }

    out += "author ";
    putSized(out, author);
    out += '\n';
    out += "date " + std::to_string(authorTimestamp) + " " + std::to_string(authorTzOffset) + "\n";
    out += "message ";
    putSized(out, message);
    out += '\n';

    out += "extras " + std::to_string(extras.size()) + "\n";
    for (const auto& [key, value] : extras) {
        putSized(out, key);
        out += ' ';
        putSized(out, value);
        out += '\n';
    }
    return out;
}

Expected<Changeset> Changeset::parse(const std::string& bytes) {
    Changeset cs;
    try {
        Reader r(bytes);
        r.literal(kFormatLine);
        r.literal("\n");

        r.literal("parents ");
        uint64_t parentCount = r.count();
        r.literal("\n");
        for (uint64_t i = 0; i < parentCount; ++i) {
            cs.parents.push_back(parseChangesetId(r.token()));
            r.literal("\n");
        }

        r.literal("files ");
        uint64_t fileCount = r.count();
        r.literal("\n");
        for (uint64_t i = 0; i < fileCount; ++i) {
            if (r.peek('D')) {
                r.literal("D ");
                std::string path = r.sized();
                cs.fileChanges[path] = FileChange::deleted();
            } else {
                r.literal("M ");
                std::string path = r.sized();
                r.literal(" ");
                auto content = ContentId::fromHex(r.token());
                if (!content) throw std::runtime_error("bad content id for " + path);
                r.literal(" ");
                uint64_t size = r.count();
                r.literal(" ");
                auto type = parseFileType(r.token());
                if (!type) throw std::runtime_error("bad file type for " + path);
                std::optional<CopyFrom> copy;
                if (r.peek(' ')) {
                    r.literal(" C ");
                    std::string from = r.sized();
                    r.literal(" ");
                    copy = CopyFrom{from, parseChangesetId(r.token())};
                }
                cs.fileChanges[path] = FileChange::modified(*content, size, *type, copy);
            }
            r.literal("\n");
        }

        r.literal("author ");
        cs.author = r.sized();
        r.literal("\n");
        r.literal("date ");
        cs.authorTimestamp = r.number();
        r.literal(" ");
        cs.authorTzOffset = static_cast<int32_t>(r.number());
        r.literal("\n");
        r.literal("message ");
        cs.message = r.sized();
        r.literal("\n");

        r.literal("extras ");
        uint64_t extraCount = r.count();
        r.literal("\n");
        for (uint64_t i = 0; i < extraCount; ++i) {
            std::string key = r.sized();
            r.literal(" ");
            cs.extras[key] = r.sized();
            r.literal("\n");
        }
        if (!r.atEnd()) throw std::runtime_error("trailing bytes after extras");
    } catch (const std::exception& e) {
        return Error{ErrorCode::CorruptObject, std::string("malformed changeset: ") + e.what()};
    }
    return cs;
}

ChangesetId Changeset::computeId() const {
    std::string body = serialize();
    std::string header = "changeset " + std::to_string(body.size());
    header += '\0';
    auto hasher = HasherFactory::createDefault();
    hasher->update(header);
    hasher->update(body);
    return ChangesetId(hasher->hexDigest());
}

bool isValidPath(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.back() == '/') return false;
    if (path.find_first_of(std::string("\0\t\n", 3)) != std::string::npos) return false;
    std::istringstream iss(path);
    std::string component;
    while (std::getline(iss, component, '/')) {
        if (component.empty() || component == "." || component == "..") return false;
    }
    return true;
}

bool pathIsPrefixOf(const std::string& prefix, const std::string& path) {
    if (path.size() < prefix.size()) return false;
    if (path.compare(0, prefix.size(), prefix) != 0) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

Expected<void> Changeset::verify() const {
    std::set<ChangesetId> seenParents;
    for (const auto& p : parents) {
        if (p.empty()) return Error{ErrorCode::InvalidArgs, "empty parent id"};
        if (!seenParents.insert(p).second) {
            return Error{ErrorCode::InvalidArgs, "duplicate parent " + p.hex()};
        }
    }

    for (const auto& [path, change] : fileChanges) {
        if (!isValidPath(path)) {
            return Error{ErrorCode::InvalidArgs, "invalid path", {path}};
        }
        if (change.copyFrom) {
            if (!isValidPath(change.copyFrom->path)) {
                return Error{ErrorCode::InvalidArgs, "invalid copy source", {path, change.copyFrom->path}};
            }
            if (seenParents.count(change.copyFrom->changeset) == 0) {
                return Error{ErrorCode::InvalidArgs, "copy source is not a parent",
                             {path, change.copyFrom->changeset.hex()}};
            }
        }
    }

    // A modified "a" cannot coexist with a modified "a/b".
    for (const auto& [path, change] : fileChanges) {
        if (change.isDeleted()) continue;
        size_t slash = path.rfind('/');
        while (slash != std::string::npos) {
            std::string dir = path.substr(0, slash);
            auto it = fileChanges.find(dir);
            if (it != fileChanges.end() && !it->second.isDeleted()) {
                return Error{ErrorCode::InvalidArgs, "path is both a file and a directory", {dir, path}};
            }
            slash = dir.rfind('/');
        }
    }
    return {};
}

std::optional<std::string> Changeset::extra(const std::string& key) const {
    auto it = extras.find(key);
    if (it == extras.end()) return std::nullopt;
    return it->second;
}

std::string Changeset::shortMessage() const {
    size_t newlinePos = message.find('\n');
    if (newlinePos != std::string::npos) {
        return message.substr(0, newlinePos);
    }
    return message;
}

}
