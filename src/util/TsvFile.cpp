#include "util/TsvFile.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace monosync {

Expected<std::vector<TsvFile::Record>> TsvFile::load() const {
    std::vector<Record> records;
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        // Missing table is empty (first use)
        return records;
    }

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read " + filePath.string()};
    }

    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string::npos) {
            // Torn final record from an interrupted append
            break;
        }
        std::string line = content.substr(start, end - start);
        start = end + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        Record record;
        std::istringstream iss(line);
        std::string field;
        while (std::getline(iss, field, '\t')) {
            record.push_back(field);
        }
        records.push_back(std::move(record));
    }
    return records;
}

Expected<void> TsvFile::append(const Record& record) const {
    std::error_code ec;
    fs::create_directories(filePath.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create directory: " + ec.message()};
    }

    std::string line;
    for (size_t i = 0; i < record.size(); ++i) {
        if (i) line += '\t';
        line += record[i];
    }
    line += '\n';

    // Terminate a torn record left by an interrupted append so it stays a
    // separate (malformed) line instead of corrupting this one.
    if (fs::exists(filePath, ec) && fs::file_size(filePath, ec) > 0 && !ec) {
        std::ifstream tail(filePath, std::ios::binary);
        tail.seekg(-1, std::ios::end);
        char last = '\n';
        if (tail.get(last) && last != '\n') {
            line.insert(line.begin(), '\n');
        }
    }

    std::ofstream out(filePath, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open " + filePath.string()};
    }
    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.flush();
    if (!out || !out.good()) {
        return Error{ErrorCode::IoError, "Failed to append to " + filePath.string()};
    }
    return {};
}

}
