#ifndef CLI_IMPL_H
#define CLI_IMPL_H

#include <string>
#include <vector>

int runCommand(const std::vector<std::string>& args);
int runCLIImpl(int argc, char** argv);

#endif
