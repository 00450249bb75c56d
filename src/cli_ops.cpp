#include "cli_ops.h"

#include "cli_args.h"
#include "cli_parse.h"
#include "generator.h"

#include <algorithm>
#include <stdexcept>

namespace {
constexpr int kMaxKernelSize = 255;
constexpr double kGaussianNoiseMean = 0.5;
constexpr double kGaussianNoiseIntensity = 0.7;

std::string requireValue(const std::string& name, const std::string& value) {
    if (value.empty()) {
        throw std::runtime_error("Expected a value for " + name);
    }
    return value;
}

int parseKernelSize(const std::string& name, const std::string& value) {
    return parseIntInRange(requireValue(name, value), name, 1, kMaxKernelSize);
}

Generator noiseGenerator(const RgbaImage& source, const std::shared_ptr<RandomSource>& random) {
    return Generator(std::max(source.width(), source.height()), random);
}
} // namespace

int oddKernelSize(int requested) {
    return requested % 2 == 0 ? requested + 1 : requested;
}

Pipeline applyOption(const Pipeline& pipeline,
                     const std::string& option,
                     const RgbaImage& source,
                     const std::shared_ptr<RandomSource>& random) {
    std::string name;
    std::string value;
    splitOption(option, name, value);

    if (name == "--gaussian-blur") {
        const int size = oddKernelSize(parseKernelSize(name, value));
        return pipeline.filter(Generator(size, random).gaussianNeedle(static_cast<double>(size) / 10.0 + 0.1));
    }
    if (name == "--average-blur") {
        const int size = oddKernelSize(parseKernelSize(name, value));
        return pipeline.filter(Generator(size, random).averageNeedle());
    }
    if (name == "--median") {
        return pipeline.filter(Filter::median(parseKernelSize(name, value)));
    }
    if (name == "--gaussian-noise") {
        const double strength = parseDoubleStrict(requireValue(name, value), "noise variance");
        if (!(strength > 0.0)) {
            throw std::runtime_error("Gaussian noise variance must be > 0: " + value);
        }
        return pipeline.ennoise(noiseGenerator(source, random)
                                    .gaussianNoise(kGaussianNoiseMean, 1.0 / strength, kGaussianNoiseIntensity));
    }
    if (name == "--impulse-noise") {
        const double variance = parseDoubleStrict(requireValue(name, value), "noise variance");
        if (!(variance > 0.0)) {
            throw std::runtime_error("Impulse noise variance must be > 0: " + value);
        }
        return pipeline.ennoise(noiseGenerator(source, random).saltAndPepperNoise(variance));
    }
    if (name == "--canny") {
        return pipeline.canny(parseThresholds(value));
    }
    if (name == "--grayscale") {
        return pipeline.grayscale();
    }
    if (name == "--gradient") {
        return pipeline.gradient();
    }
    if (name == "--invert") {
        return pipeline.invert();
    }

    throw std::runtime_error("Unexpected option '" + option + "'");
}

Pipeline buildPipeline(const std::vector<std::string>& options,
                       const RgbaImage& source,
                       const std::shared_ptr<RandomSource>& random) {
    Pipeline pipeline;
    for (const std::string& option : options) {
        pipeline = applyOption(pipeline, option, source, random);
    }
    return pipeline;
}
