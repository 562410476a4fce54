#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace monosync {

/**
 * @brief Append-only tab separated table on disk
 *
 * Backs the identifier and synced-commit tables. One record per line,
 * fields separated by TAB, no escaping (callers only store ids, numbers and
 * validated names, none of which contain TAB or newline).
 *
 * A record is appended with a single write followed by a flush; a torn last
 * line left by a crash is ignored on load, so a half-written record is the
 * same as a record that was never written. Callers skip records whose
 * fields do not parse for the same reason.
 */
class TsvFile {
public:
    using Record = std::vector<std::string>;

    explicit TsvFile(std::filesystem::path path) : filePath(std::move(path)) {}

    /// All complete records; a missing file is an empty table
    Expected<std::vector<Record>> load() const;

    /// Append one record; IoError if the write does not reach the file
    Expected<void> append(const Record& record) const;

    const std::filesystem::path& path() const { return filePath; }

private:
    std::filesystem::path filePath;
};

}
