#include "cli_impl.h"

#include "bmp.h"
#include "cli_args.h"
#include "cli_help.h"
#include "cli_ops.h"

#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>

int runCommand(const std::vector<std::string>& args) {
    const CommandLine cmd = parseCommandLine(args);

    std::shared_ptr<RandomSource> random;
    if (cmd.hasSeed) {
        random = std::make_shared<MersenneRandomSource>(cmd.seed);
    } else {
        random = std::make_shared<MersenneRandomSource>();
    }

    std::cout << "Loading image " << cmd.sourcePath << "\n";
    const RgbaImage source = loadBMP(cmd.sourcePath);

    const Pipeline pipeline = buildPipeline(cmd.options, source, random);

    std::cout << "Calculating\n";
    const RgbaImage result = pipeline.apply(source);
    std::cout << "Calculated: " << result.width() << "x" << result.height() << "\n";

    if (!saveBMP(result, cmd.destinationPath)) {
        std::cerr << "Failed writing output image: " << cmd.destinationPath << "\n";
        return 1;
    }
    std::cout << "Saved " << cmd.destinationPath << "\n";
    return 0;
}

int runCLIImpl(int argc, char** argv) {
    try {
        const std::vector<std::string> args = collectArgs(argc, argv);
        if (args.size() <= 1) {
            writeUsage();
            return 1;
        }

        const std::string command = args[1];
        if (command == "help" || command == "--help" || command == "-h") {
            writeUsage();
            return 0;
        }
        return runCommand(args);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
}
