#ifndef CLI_ARGS_H
#define CLI_ARGS_H

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

struct CommandLine {
    std::string sourcePath;
    std::string destinationPath;
    std::vector<std::string> options;
    bool hasSeed = false;
    std::uint32_t seed = 0;
};

std::vector<std::string> collectArgs(int argc, char** argv);
void addOpsFromStream(std::istream& in, std::vector<std::string>& outOps);
// Splits "--name=value" into name and value; value is empty without '='.
void splitOption(const std::string& option, std::string& name, std::string& value);
// args[0] is the program name. Expands --ops-file and extracts --seed.
CommandLine parseCommandLine(const std::vector<std::string>& args);

#endif
