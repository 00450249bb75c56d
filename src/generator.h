#ifndef GENERATOR_H
#define GENERATOR_H

#include "noise.h"
#include "pipeline.h"

#include <memory>
#include <stdexcept>
#include <utility>

// Factory for noise pipelines and kernel filters, keyed by a kernel size.
// Noise pipelines draw from the shared random source each time they run and
// only use the dimensions of the raster they are applied to.
template <typename ImageT>
class BasicGenerator {
public:
    explicit BasicGenerator(int size)
        : BasicGenerator(size, std::make_shared<MersenneRandomSource>()) {}

    BasicGenerator(int size, std::shared_ptr<RandomSource> random)
        : m_size(size), m_random(std::move(random)) {
        if (!m_random) {
            throw std::invalid_argument("Generator requires a random source");
        }
    }

    int size() const { return m_size; }

    BasicPipeline<ImageT> gaussianNoise(double mean, double variance, double intensity) const {
        if (!(variance > 0.0)) {
            throw std::invalid_argument("Gaussian noise variance must be > 0");
        }
        std::shared_ptr<RandomSource> random = m_random;
        return BasicPipeline<ImageT>().then([random, mean, variance, intensity](const ImageT& image) {
            return image.similar([&random, mean, variance, intensity](int, int) {
                return gaussianNoisePixel(*random, mean, variance, intensity);
            });
        });
    }

    BasicPipeline<ImageT> saltAndPepperNoise(double variance) const {
        if (!(variance > 0.0)) {
            throw std::invalid_argument("Impulse noise variance must be > 0");
        }
        std::shared_ptr<RandomSource> random = m_random;
        return BasicPipeline<ImageT>().then([random, variance](const ImageT& image) {
            return image.similar([&random, variance](int, int) {
                return saltAndPepperPixel(*random, variance);
            });
        });
    }

    BasicFilter<ImageT> averageNeedle() const {
        return BasicFilter<ImageT>::average(m_size);
    }

    BasicFilter<ImageT> gaussianNeedle(double variance) const {
        return BasicFilter<ImageT>::gaussian(m_size, variance);
    }

private:
    int m_size;
    std::shared_ptr<RandomSource> m_random;
};

using Generator = BasicGenerator<RgbaImage>;

#endif
