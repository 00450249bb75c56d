#include "cli_impl.h"

int main(int argc, char** argv) {
    return runCLIImpl(argc, argv);
}
