#include "cli/CommandInvoker.hpp"

#include "util/Logger.hpp"

namespace monosync {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().describe());
        return res;
    }
    return {};
}

Expected<std::vector<std::string>> CommandInvoker::applyGlobalOptions(const std::vector<std::string>& args) {
    std::vector<std::string> rest;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        if (args[i] != "--log-level") break;
        if (i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, "--log-level requires a value"};
        }
        auto level = parseLogLevel(args[i + 1]);
        if (!level) {
            return Error{ErrorCode::InvalidArgs, "unknown log level '" + args[i + 1] + "'"};
        }
        Logger::instance().setLevel(*level);
        ++i;
    }
    rest.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return rest;
}

}
