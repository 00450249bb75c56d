#ifndef PIPELINE_H
#define PIPELINE_H

#include "image.h"
#include "noise.h"
#include "rgba.h"

#include <cmath>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ImageT must provide, besides the Image accessors:
//   static ImageT black(int width, int height);
//   ImageT(int width, int height, const Rgba& fill);
//   ImageT(int width, int height, std::function<Rgba(int, int)>);
//   ImageT similar(std::function<Rgba(int, int)>) const;
//   const Rgba& getPixelClamped(int x, int y) const;
template <typename ImageT>
class BasicFilter;

// Ordered list of raster-to-raster steps. Building never runs anything;
// apply() and generate() fold the steps over a copy of the input.
template <typename ImageT>
class BasicPipeline {
public:
    using Step = std::function<ImageT(const ImageT&)>;
    using PixelOp = std::function<Rgba(const Rgba&, const Rgba&)>;
    using KernelFunction = std::function<Rgba(int, int)>;
    using Combinator = std::function<BasicPipeline(const BasicPipeline&, const BasicPipeline&)>;

    BasicPipeline() = default;

    // Pipeline whose first step discards its input and yields a copy of image.
    static BasicPipeline constant(const ImageT& image);

    static Combinator addCombinator();
    static Combinator minCombinator();
    static Combinator maxCombinator();

    BasicPipeline then(Step step) const;

    std::size_t stepCount() const { return m_steps.size(); }
    bool empty() const { return m_steps.empty(); }

    // Output (x, y) reads input (x + dx, y + dy), clamped to the edge.
    BasicPipeline offset(int dx, int dy) const;
    BasicPipeline dim(const Rgba& factor) const;

    // other runs on the raster produced so far; results merge with op.
    BasicPipeline combine(const BasicPipeline& other, PixelOp op) const;
    BasicPipeline add(const BasicPipeline& other) const;
    // Keeps the left operand's alpha.
    BasicPipeline sub(const BasicPipeline& other) const;
    BasicPipeline minWith(const BasicPipeline& other) const;
    BasicPipeline maxWith(const BasicPipeline& other) const;
    // noise is expected centred on 0.5; it is recentred to [-1, 1] and added.
    BasicPipeline ennoise(const BasicPipeline& noise) const;

    BasicPipeline invert() const;
    BasicPipeline grayscale() const;

    BasicPipeline convolve(int kernelWidth, int kernelHeight, KernelFunction kernel, Combinator combinator) const;
    BasicPipeline convolveBy(const ImageT& kernel, Combinator combinator) const;
    BasicPipeline filter(const BasicFilter<ImageT>& filter) const;

    // size and variance are accepted for interface compatibility; the blur is
    // always a 5x5 kernel of variance 0.6.
    BasicPipeline gaussianBlur(int size, double variance) const;
    BasicPipeline gradient() const;
    BasicPipeline nonMaxSuppress() const;
    BasicPipeline quantize(std::vector<double> thresholds) const;
    BasicPipeline canny(std::vector<double> thresholds) const;

    ImageT apply(const ImageT& image) const;
    ImageT generate(int width, int height) const;

private:
    std::vector<Step> m_steps;
};

// Either a convolution kernel, declared as a pipeline that yields the kernel
// raster when generated, or the size of a min/max median approximation.
template <typename ImageT>
class BasicFilter {
public:
    enum class Kind {
        Convoluted,
        Median
    };

    static BasicFilter convoluted(const BasicPipeline<ImageT>& needle);
    static BasicFilter median(int size);

    // Radially symmetric Gaussian density of the distance to the centre.
    static BasicFilter gaussian(int size, double variance);
    // Uniform weight 1 / (size * size).
    static BasicFilter average(int size);

    Kind kind() const { return m_kind; }
    bool isConvoluted() const { return m_kind == Kind::Convoluted; }
    bool isMedian() const { return m_kind == Kind::Median; }

    const BasicPipeline<ImageT>& needle() const;
    int medianSize() const;

private:
    BasicFilter(Kind kind, BasicPipeline<ImageT> needle, int size)
        : m_kind(kind), m_needle(std::move(needle)), m_size(size) {}

    Kind m_kind;
    BasicPipeline<ImageT> m_needle;
    int m_size;
};

using Pipeline = BasicPipeline<RgbaImage>;
using Filter = BasicFilter<RgbaImage>;

namespace detail {
inline void requireOddKernelSize(int size, const char* context) {
    if (size <= 0 || size % 2 == 0) {
        throw std::invalid_argument(std::string(context) + " kernel size must be odd and positive, got " +
                                    std::to_string(size));
    }
}

template <typename ImageT, typename F>
ImageT mapPixels(const ImageT& image, F f) {
    return image.similar([&image, &f](int x, int y) {
        return f(image.getPixel(x, y));
    });
}

// Gradient kernel: -1 on the top and left mid-edges, +1 on the bottom and
// right ones, zero at the centre and corners.
inline Rgba gradientKernel(int x, int y) {
    if ((x == 1 && y == 0) || (x == 0 && y == 1)) {
        return Rgba::WHITE.map([](double v) { return -v; });
    }
    if ((x == 1 && y == 2) || (x == 2 && y == 1)) {
        return Rgba::WHITE;
    }
    if ((x == 0 || x == 1 || x == 2) && (y == 0 || y == 1 || y == 2)) {
        return Rgba::BLACK;
    }
    throw std::logic_error("Gradient kernel index out of range (x = " + std::to_string(x) +
                           ", y = " + std::to_string(y) + ")");
}
} // namespace detail

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::constant(const ImageT& image) {
    auto frozen = std::make_shared<const ImageT>(image);
    return BasicPipeline().then([frozen](const ImageT&) {
        return *frozen;
    });
}

template <typename ImageT>
typename BasicPipeline<ImageT>::Combinator BasicPipeline<ImageT>::addCombinator() {
    return [](const BasicPipeline& lhs, const BasicPipeline& rhs) {
        return lhs.add(rhs);
    };
}

template <typename ImageT>
typename BasicPipeline<ImageT>::Combinator BasicPipeline<ImageT>::minCombinator() {
    return [](const BasicPipeline& lhs, const BasicPipeline& rhs) {
        return lhs.minWith(rhs);
    };
}

template <typename ImageT>
typename BasicPipeline<ImageT>::Combinator BasicPipeline<ImageT>::maxCombinator() {
    return [](const BasicPipeline& lhs, const BasicPipeline& rhs) {
        return lhs.maxWith(rhs);
    };
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::then(Step step) const {
    BasicPipeline next(*this);
    next.m_steps.push_back(std::move(step));
    return next;
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::offset(int dx, int dy) const {
    return then([dx, dy](const ImageT& image) {
        return image.similar([&image, dx, dy](int x, int y) {
            return image.getPixelClamped(x + dx, y + dy);
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::dim(const Rgba& factor) const {
    return then([factor](const ImageT& image) {
        return detail::mapPixels(image, [&factor](const Rgba& px) {
            return px * factor;
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::combine(const BasicPipeline& other, PixelOp op) const {
    return then([other, op](const ImageT& image) {
        const ImageT rhs = other.apply(image);
        return image.similar([&image, &rhs, &op](int x, int y) {
            return op(image.getPixel(x, y), rhs.getPixel(x, y));
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::add(const BasicPipeline& other) const {
    return combine(other, [](const Rgba& lhs, const Rgba& rhs) {
        return lhs + rhs;
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::sub(const BasicPipeline& other) const {
    return combine(other, [](const Rgba& lhs, const Rgba& rhs) {
        return (lhs - rhs).withAlpha(lhs.a);
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::minWith(const BasicPipeline& other) const {
    return combine(other, [](const Rgba& lhs, const Rgba& rhs) {
        return lhs.min(rhs);
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::maxWith(const BasicPipeline& other) const {
    return combine(other, [](const Rgba& lhs, const Rgba& rhs) {
        return lhs.max(rhs);
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::ennoise(const BasicPipeline& noise) const {
    return combine(noise, [](const Rgba& lhs, const Rgba& rhs) {
        return lhs + (rhs - Rgba::NEUTRAL_GRAY) * Rgba::gray(2.0);
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::invert() const {
    return then([](const ImageT& image) {
        return detail::mapPixels(image, [](const Rgba& px) {
            return Rgba::gray(1.0) - px;
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::grayscale() const {
    // Rgba::grayscale() weights the channels again after this dim.
    return dim(Rgba::GRAYSCALE_FACTOR).then([](const ImageT& image) {
        return detail::mapPixels(image, [](const Rgba& px) {
            return px.grayscale();
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::convolve(int kernelWidth,
                                                      int kernelHeight,
                                                      KernelFunction kernel,
                                                      Combinator combinator) const {
    if (kernelWidth <= 0 || kernelHeight <= 0) {
        throw std::invalid_argument("Convolution kernel must have at least one cell");
    }
    return then([kernelWidth, kernelHeight, kernel, combinator](const ImageT& image) {
        // One shifted, weighted copy of the input per kernel cell, folded with
        // the combinator. The first cell seeds the fold.
        auto frozen = std::make_shared<const ImageT>(image);
        BasicPipeline folded;
        bool seeded = false;
        for (int x = 0; x < kernelWidth; ++x) {
            for (int y = 0; y < kernelHeight; ++y) {
                BasicPipeline cell = BasicPipeline()
                    .then([frozen](const ImageT&) { return *frozen; })
                    .offset(x - kernelWidth / 2, y - kernelHeight / 2)
                    .dim(kernel(x, y));
                folded = seeded ? combinator(folded, cell) : cell;
                seeded = true;
            }
        }
        return folded.generate(image.width(), image.height());
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::convolveBy(const ImageT& kernel, Combinator combinator) const {
    auto weights = std::make_shared<const ImageT>(kernel);
    return convolve(kernel.width(), kernel.height(), [weights](int x, int y) {
        return weights->getPixel(x, y);
    }, std::move(combinator));
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::filter(const BasicFilter<ImageT>& filter) const {
    if (filter.isConvoluted()) {
        const BasicPipeline needle = filter.needle();
        return then([needle](const ImageT& image) {
            // Kernel pipelines ignore the canvas size they are generated at.
            const ImageT kernel = needle.generate(0, 0);
            return BasicPipeline().convolveBy(kernel, addCombinator()).apply(image);
        });
    }

    // Median approximation: the mean of the neighbourhood minimum and maximum,
    // not a true order statistic.
    const int size = filter.medianSize();
    return then([size](const ImageT& image) {
        const ImageT window(size, size, Rgba::WHITE);
        const ImageT low = BasicPipeline().convolveBy(window, minCombinator()).apply(image);
        const ImageT high = BasicPipeline().convolveBy(window, maxCombinator()).apply(image);
        return image.similar([&low, &high](int x, int y) {
            return (low.getPixel(x, y) + high.getPixel(x, y)) / 2.0;
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::gaussianBlur(int size, double variance) const {
    static_cast<void>(size);
    static_cast<void>(variance);
    return filter(BasicFilter<ImageT>::gaussian(5, 0.6));
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::gradient() const {
    return convolve(3, 3, detail::gradientKernel, addCombinator()).then([](const ImageT& image) {
        return detail::mapPixels(image, [](const Rgba& px) {
            return px.abs();
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::nonMaxSuppress() const {
    return then([](const ImageT& image) {
        return image.similar([&image](int x, int y) {
            const int xp = x > 0 ? x - 1 : 0;
            const int xn = x + 1 < image.width() ? x + 1 : image.width() - 1;
            const int yp = y > 0 ? y - 1 : 0;
            const int yn = y + 1 < image.height() ? y + 1 : image.height() - 1;
            const Rgba& center = image.getPixel(x, y);

            const auto isPeak = [&image, &center](int ax, int ay, int bx, int by) {
                return image.getPixel(ax, ay) < center && image.getPixel(bx, by) < center;
            };

            if (isPeak(xp, yp, xn, yn) ||
                isPeak(xp, y, xn, y) ||
                isPeak(x, yp, x, yn) ||
                isPeak(xp, yn, xn, yp)) {
                return center;
            }
            return Rgba::BLACK;
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::quantize(std::vector<double> thresholds) const {
    if (thresholds.empty()) {
        throw std::invalid_argument("quantize requires at least one threshold");
    }

    // Largest threshold first, 0.0 sentinel last. Level n of the reversed list
    // renders as gray n / thresholds.size().
    const double count = static_cast<double>(thresholds.size());
    std::vector<std::pair<double, Rgba>> steps;
    for (auto it = thresholds.rbegin(); it != thresholds.rend(); ++it) {
        steps.emplace_back(*it, Rgba::gray(static_cast<double>(steps.size()) / count));
    }
    steps.emplace_back(0.0, Rgba::gray(static_cast<double>(steps.size()) / count));

    return then([steps](const ImageT& image) {
        return detail::mapPixels(image, [&steps](const Rgba& px) {
            const double intensity = (px.r + px.g + px.b) / 3.0;
            for (const auto& step : steps) {
                if (intensity >= step.first) {
                    return step.second;
                }
            }
            return steps.back().second;
        });
    });
}

template <typename ImageT>
BasicPipeline<ImageT> BasicPipeline<ImageT>::canny(std::vector<double> thresholds) const {
    return grayscale()
        .gaussianBlur(5, 0.6)
        .gradient()
        .nonMaxSuppress()
        .quantize(std::move(thresholds));
}

template <typename ImageT>
ImageT BasicPipeline<ImageT>::apply(const ImageT& image) const {
    ImageT current = image;
    for (const Step& step : m_steps) {
        current = step(current);
    }
    return current;
}

template <typename ImageT>
ImageT BasicPipeline<ImageT>::generate(int width, int height) const {
    return apply(ImageT::black(width, height));
}

template <typename ImageT>
BasicFilter<ImageT> BasicFilter<ImageT>::convoluted(const BasicPipeline<ImageT>& needle) {
    return BasicFilter(Kind::Convoluted, needle, 0);
}

template <typename ImageT>
BasicFilter<ImageT> BasicFilter<ImageT>::median(int size) {
    if (size <= 0) {
        throw std::invalid_argument("Median size must be positive, got " + std::to_string(size));
    }
    return BasicFilter(Kind::Median, BasicPipeline<ImageT>(), size);
}

template <typename ImageT>
BasicFilter<ImageT> BasicFilter<ImageT>::gaussian(int size, double variance) {
    detail::requireOddKernelSize(size, "Gaussian");
    if (!(variance > 0.0)) {
        throw std::invalid_argument("Gaussian kernel variance must be > 0");
    }
    return convoluted(BasicPipeline<ImageT>().then([size, variance](const ImageT&) {
        const int center = size / 2;
        return ImageT(size, size, [center, variance](int i, int j) {
            const double di = static_cast<double>(i - center);
            const double dj = static_cast<double>(j - center);
            return Rgba::gray(gaussianDensity(std::sqrt(di * di + dj * dj), 0.0, variance));
        });
    }));
}

template <typename ImageT>
BasicFilter<ImageT> BasicFilter<ImageT>::average(int size) {
    detail::requireOddKernelSize(size, "Average");
    const Rgba weight = Rgba::gray(1.0 / static_cast<double>(size * size));
    return convoluted(BasicPipeline<ImageT>().then([size, weight](const ImageT&) {
        return ImageT(size, size, weight);
    }));
}

template <typename ImageT>
const BasicPipeline<ImageT>& BasicFilter<ImageT>::needle() const {
    if (m_kind != Kind::Convoluted) {
        throw std::logic_error("Median filter has no kernel pipeline");
    }
    return m_needle;
}

template <typename ImageT>
int BasicFilter<ImageT>::medianSize() const {
    if (m_kind != Kind::Median) {
        throw std::logic_error("Convoluted filter has no median size");
    }
    return m_size;
}

#endif
