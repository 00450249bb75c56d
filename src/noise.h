#ifndef NOISE_H
#define NOISE_H

#include "rgba.h"

#include <cstdint>
#include <mutex>
#include <random>

// Source of randomness handed to noise generators. Substitute a scripted
// implementation to make noise reproducible.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [0, 1).
    virtual double uniform() = 0;
    // Fair coin.
    virtual bool coin() = 0;
};

// Safe to share between pipelines applied on different threads; every draw
// takes the engine lock.
class MersenneRandomSource : public RandomSource {
public:
    MersenneRandomSource();
    explicit MersenneRandomSource(std::uint32_t seed);

    double uniform() override;
    bool coin() override;

private:
    std::mutex m_mutex;
    std::mt19937 m_engine;
    std::uniform_real_distribution<double> m_unit;
    std::bernoulli_distribution m_coin;
};

double gaussianDensity(double x, double mean, double variance);

// 0.5 +/- density(sample) * intensity, sign picked by a coin.
Rgba gaussianNoisePixel(RandomSource& random, double mean, double variance, double intensity);

// White or black (coin) when the density of the sample around 0.5 exceeds
// kImpulseDensityThreshold, neutral gray otherwise.
Rgba saltAndPepperPixel(RandomSource& random, double variance);

constexpr double kImpulseDensityThreshold = 0.6;

#endif
