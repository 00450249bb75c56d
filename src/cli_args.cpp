#include "cli_args.h"

#include "cli_parse.h"

#include <fstream>
#include <limits>
#include <stdexcept>

std::vector<std::string> collectArgs(int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

void addOpsFromStream(std::istream& in, std::vector<std::string>& outOps) {
    std::string line;
    while (std::getline(in, line)) {
        std::size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            continue;
        }
        if (line[start] == '#') {
            continue;
        }
        const std::size_t end = line.find_last_not_of(" \t\r\n");
        outOps.push_back(line.substr(start, end - start + 1));
    }
}

void splitOption(const std::string& option, std::string& name, std::string& value) {
    const std::size_t eq = option.find('=');
    if (eq == std::string::npos) {
        name = option;
        value.clear();
        return;
    }
    name = option.substr(0, eq);
    value = option.substr(eq + 1);
}

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        throw std::runtime_error("Expected source and destination image");
    }

    CommandLine cmd;
    cmd.sourcePath = args[1];
    cmd.destinationPath = args[2];

    std::vector<std::string> pending;
    for (std::size_t i = 3; i < args.size(); ++i) {
        std::string name;
        std::string value;
        splitOption(args[i], name, value);
        if (name == "--ops-file") {
            if (value.empty()) {
                throw std::runtime_error("--ops-file requires a path");
            }
            std::ifstream file(value);
            if (!file.is_open()) {
                throw std::runtime_error("Failed to open ops file: " + value);
            }
            addOpsFromStream(file, pending);
            continue;
        }
        pending.push_back(args[i]);
    }

    for (const std::string& option : pending) {
        std::string name;
        std::string value;
        splitOption(option, name, value);
        if (name == "--seed") {
            cmd.seed = static_cast<std::uint32_t>(
                parseIntInRange(value, "seed", 0, std::numeric_limits<int>::max()));
            cmd.hasSeed = true;
            continue;
        }
        cmd.options.push_back(option);
    }
    return cmd;
}
