#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/Repository.hpp"
#include "sync/SyncContext.hpp"

namespace monosync {

/// Directory a command works in (ctx.workDir, or the process cwd)
std::filesystem::path workDirOf(const AppContext& ctx);

/// Find .monosync above the working directory and open it
Expected<std::unique_ptr<SyncContext>> openContext(const AppContext& ctx);

/// Repository by name; the small repository when `name` is empty
Expected<Repository*> selectRepo(SyncContext& sync, const std::string& name);

/**
 * @brief Remove "<flag> <value>" from args
 *
 * Returns the value of the last occurrence, or an empty string when the
 * flag is absent. InvalidArgs if the flag is last with no value.
 */
Expected<std::string> takeOption(std::vector<std::string>& args, const std::string& flag);

/// Remove every "<flag> <value>" from args, returning the values in order
Expected<std::vector<std::string>> takeOptions(std::vector<std::string>& args, const std::string& flag);

/// Remove a boolean flag from args; true if it was present
bool takeFlag(std::vector<std::string>& args, const std::string& flag);

/// Read a local file as bytes
Expected<std::string> readLocalFile(const std::filesystem::path& path);

}
