#include "CommandLine.hpp"

#include "CopyError.hpp"

#include <utility>

namespace {
bool TakeValue(
    const std::vector<std::string>& args,
    size_t& index,
    const std::string& shortName,
    const std::string& longName,
    std::string& outValue) {
    const std::string& arg = args[index];
    const std::string longPrefix = longName + "=";
    if (arg.rfind(longPrefix, 0) == 0) {
        outValue = arg.substr(longPrefix.size());
        return true;
    }

    if (arg != shortName && arg != longName) {
        return false;
    }

    if (index + 1 >= args.size()) {
        throw CopyError(ErrorKind::Argument, "option " + arg + " requires a value");
    }
    outValue = args[++index];
    return true;
}

std::pair<std::string, std::string> SplitConfigValue(const std::string& value) {
    const auto equals = value.find('=');
    if (equals == std::string::npos || equals == 0) {
        throw CopyError(ErrorKind::Argument, "bad key=value pair: " + value);
    }
    return {value.substr(0, equals), value.substr(equals + 1)};
}
} // namespace

ParsedCommandLine ParseCommandLine(const std::vector<std::string>& args) {
    ParsedCommandLine parsed;
    std::vector<std::string> positionals;
    bool optionsDone = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (optionsDone || arg.empty() || arg[0] != '-' || arg == "-") {
            positionals.push_back(arg);
        } else if (arg == "--") {
            optionsDone = true;
        } else if (arg == "-h" || arg == "--help") {
            parsed.help = true;
        } else if (arg == "-e" || arg == "--ephemeral") {
            parsed.request.ephemeral = true;
        } else if (arg == "--container-only") {
            parsed.request.containerOnly = true;
        } else if (arg == "--stateful") {
            parsed.request.stateful = true;
        } else if (arg == "--keep-volatile") {
            parsed.request.keepVolatile = true;
        } else if (TakeValue(args, i, "-p", "--profile", value)) {
            parsed.request.profiles.push_back(value);
        } else if (TakeValue(args, i, "-c", "--config", value)) {
            parsed.request.configOverrides.push_back(SplitConfigValue(value));
        } else {
            throw CopyError(ErrorKind::Argument, "unknown option " + arg);
        }
    }

    if (parsed.help) {
        return parsed;
    }

    if (positionals.empty()) {
        throw CopyError(ErrorKind::Argument, "missing source container");
    }
    if (positionals.size() > 2) {
        throw CopyError(ErrorKind::Argument, "too many arguments");
    }

    parsed.request.sourceLocator = positionals[0];
    if (positionals.size() == 2) {
        parsed.request.destLocator = positionals[1];
    }
    return parsed;
}

std::string UsageText() {
    return "Usage: ctcopy [<remote>:]<source>[/<snapshot>] [[<remote>:]<destination>] [--ephemeral|-e]\n"
           "              [--profile|-p <profile>...] [--config|-c <key=value>...] [--container-only]\n"
           "              [--stateful] [--keep-volatile]\n"
           "\n"
           "Copy containers within or in between container hosts.\n";
}
