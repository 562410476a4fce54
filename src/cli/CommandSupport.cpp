#include "cli/CommandSupport.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace monosync {

fs::path workDirOf(const AppContext& ctx) {
    return ctx.workDir.empty() ? fs::current_path() : ctx.workDir;
}

Expected<std::unique_ptr<SyncContext>> openContext(const AppContext& ctx) {
    auto root = Repository::discoverRoot(workDirOf(ctx));
    if (!root) return root.error();
    return SyncContext::openOnDisk(root.value());
}

Expected<Repository*> selectRepo(SyncContext& sync, const std::string& name) {
    if (name.empty()) return &sync.small();
    Repository* repo = sync.repo(name);
    if (!repo) {
        return Error{ErrorCode::InvalidArgs, "unknown repository '" + name + "'",
                     {"known: " + sync.small().name() + ", " + sync.large().name()}};
    }
    return repo;
}

Expected<std::vector<std::string>> takeOptions(std::vector<std::string>& args, const std::string& flag) {
    std::vector<std::string> values;
    std::vector<std::string> rest;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != flag) {
            rest.push_back(args[i]);
            continue;
        }
        if (i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, flag + " requires a value"};
        }
        values.push_back(args[++i]);
    }
    args = std::move(rest);
    return values;
}

Expected<std::string> takeOption(std::vector<std::string>& args, const std::string& flag) {
    auto values = takeOptions(args, flag);
    if (!values) return values.error();
    if (values.value().empty()) return std::string();
    return values.value().back();
}

bool takeFlag(std::vector<std::string>& args, const std::string& flag) {
    auto it = std::remove(args.begin(), args.end(), flag);
    bool found = it != args.end();
    args.erase(it, args.end());
    return found;
}

Expected<std::string> readLocalFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open " + path.string()};
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read " + path.string()};
    }
    return data;
}

}
