// Command line entry point: global options, then one command per invocation.

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"

using namespace monosync;

int main(int argc, char** argv) {
    auto& factory = CommandFactory::instance();
    registerBuiltinCommands(factory);

    std::vector<std::string> raw;
    for (int i = 1; i < argc; ++i) raw.emplace_back(argv[i]);
    auto args = CommandInvoker::applyGlobalOptions(raw);
    if (!args) {
        std::cerr << args.error().describe() << "\n";
        return 1;
    }

    AppContext ctx{std::filesystem::current_path()};
    CommandInvoker invoker;
    auto help = factory.create("help");
    if (!help) {
        std::cerr << help.error().describe() << "\n";
        return 1;
    }
    if (args.value().empty()) {
        auto shown = invoker.invoke(*help.value(), ctx, {});
        return shown ? 0 : 1;
    }

    std::vector<std::string> cmdArgs = args.value();
    std::string cmdName = cmdArgs.front();
    cmdArgs.erase(cmdArgs.begin());
    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << cmd.error().message << "\n";
        std::cerr << "run 'monosync help' for the list of commands\n";
        return 1;
    }
    auto res = invoker.invoke(*cmd.value(), ctx, cmdArgs);
    return res ? 0 : 1;
}
