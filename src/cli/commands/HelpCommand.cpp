#include "cli/commands/HelpCommand.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace monosync {

namespace {

void printDetail(const ICommand& cmd) {
    std::cout << "NAME:\n    " << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n    " << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n    " << cmd.helpDescription() << "\n";
    for (const auto& [flag, text] : cmd.helpOptions()) {
        std::cout << "\n    " << flag << "\n        " << text << "\n";
    }
}

void printOverview() {
    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);
    size_t width = 0;
    for (const auto& c : cmds) width = std::max(width, std::strlen(c->name()));

    std::cout << "usage: monosync [--log-level <level>] <command> [<args>]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << c->name() << "  "
                  << c->description() << "\n";
    }
    std::cout << "\nRun 'monosync help <command>' for the options of one command.\n";
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "help takes at most one command name"};
    }
    if (args.empty()) {
        printOverview();
        return {};
    }
    auto cmd = CommandFactory::instance().create(args.front());
    if (!cmd) {
        return Error{ErrorCode::InvalidArgs, "no help for unknown command", {args.front()}};
    }
    printDetail(*cmd.value());
    return {};
}

}
