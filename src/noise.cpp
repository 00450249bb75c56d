#include "noise.h"

#include <cmath>
#include <stdexcept>

namespace {
constexpr double kPi = 3.14159265358979323846;
} // namespace

MersenneRandomSource::MersenneRandomSource()
    : m_engine(std::random_device{}()), m_unit(0.0, 1.0), m_coin(0.5) {}

MersenneRandomSource::MersenneRandomSource(std::uint32_t seed)
    : m_engine(seed), m_unit(0.0, 1.0), m_coin(0.5) {}

double MersenneRandomSource::uniform() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_unit(m_engine);
}

bool MersenneRandomSource::coin() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_coin(m_engine);
}

double gaussianDensity(double x, double mean, double variance) {
    if (!(variance > 0.0)) {
        throw std::invalid_argument("Gaussian variance must be > 0");
    }
    const double d = x - mean;
    return std::exp(-(d * d) / (2.0 * variance)) / std::sqrt(2.0 * kPi * variance);
}

Rgba gaussianNoisePixel(RandomSource& random, double mean, double variance, double intensity) {
    const double sample = random.uniform();
    const double offset = gaussianDensity(sample, mean, variance) * intensity;
    return Rgba::gray(random.coin() ? 0.5 + offset : 0.5 - offset);
}

Rgba saltAndPepperPixel(RandomSource& random, double variance) {
    const double sample = random.uniform();
    if (gaussianDensity(sample, 0.5, variance) > kImpulseDensityThreshold) {
        return random.coin() ? Rgba::WHITE : Rgba::BLACK;
    }
    return Rgba::NEUTRAL_GRAY;
}
