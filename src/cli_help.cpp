#include "cli_help.h"

#include <iostream>

void writeUsage() {
    std::cout
        << "rasterflow CLI\n\n"
        << "Usage:\n"
        << "  rasterflow help\n"
        << "  rasterflow <source.bmp> <destination.bmp> [options...]\n\n"
        << "Options (applied left to right):\n"
        << "  --gaussian-blur=<n>      Gaussian blur, kernel size n rounded up to odd\n"
        << "  --average-blur=<n>       Box blur, kernel size n rounded up to odd\n"
        << "  --median=<n>             Min/max median approximation over n x n\n"
        << "  --gaussian-noise=<v>     Add Gaussian noise of variance 1/v\n"
        << "  --impulse-noise=<v>      Add salt-and-pepper noise of variance v\n"
        << "  --canny[=<t1,t2,...>]    Edge detection with quantization thresholds\n"
        << "  --grayscale              Luminance reduction\n"
        << "  --gradient               Gradient magnitude approximation\n"
        << "  --invert                 1 - value on every channel\n\n"
        << "Configuration:\n"
        << "  --seed=<n>               Seed noise generators for reproducible output\n"
        << "  --ops-file=<path>        Read more options, one per line, '#' comments supported\n\n"
        << "Example:\n"
        << "  rasterflow in.bmp out.bmp --impulse-noise=0.4 --median=3 --canny=0.2,0.5\n";
}
