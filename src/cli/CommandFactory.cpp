#include "cli/CommandFactory.hpp"

#include "cli/commands/BookmarksCommand.hpp"
#include "cli/commands/CheckCommand.hpp"
#include "cli/commands/CommitCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InitCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/LookupCommand.hpp"
#include "cli/commands/SyncCommand.hpp"

namespace monosync {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

Expected<std::unique_ptr<ICommand>> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) {
        return Error{ErrorCode::InvalidArgs, "Unknown command: " + name};
    }
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    // std::map keeps creators sorted by name
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
}

void registerBuiltinCommands(CommandFactory& f) {
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("init", [] { return std::make_unique<InitCommand>(); });
    f.registerCreator("commit", [] { return std::make_unique<CommitCommand>(); });
    f.registerCreator("sync", [] { return std::make_unique<SyncCommand>(); });
    f.registerCreator("lookup", [] { return std::make_unique<LookupCommand>(); });
    f.registerCreator("diff", [] { return std::make_unique<DiffCommand>(); });
    f.registerCreator("bookmarks", [] { return std::make_unique<BookmarksCommand>(); });
    f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
    f.registerCreator("check", [] { return std::make_unique<CheckCommand>(); });
}

}
