#include "bmp.h"
#include "cli_args.h"
#include "cli_impl.h"
#include "cli_ops.h"
#include "cli_parse.h"
#include "generator.h"
#include "image.h"
#include "noise.h"
#include "pipeline.h"
#include "rgba.h"

#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {
const std::string kTestOutDir = "build/output/test-images";

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

template <typename Fn>
bool throwsAs(Fn fn, const std::string& kind) {
    try {
        fn();
    } catch (const std::out_of_range&) {
        return kind == "out_of_range";
    } catch (const std::invalid_argument&) {
        return kind == "invalid_argument";
    } catch (const std::logic_error&) {
        return kind == "logic_error";
    } catch (const std::runtime_error&) {
        return kind == "runtime_error";
    }
    return false;
}

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

bool nearPixel(const Rgba& a, const Rgba& b, double eps = 1e-9) {
    return near(a.r, b.r, eps) && near(a.g, b.g, eps) && near(a.b, b.b, eps) && near(a.a, b.a, eps);
}

bool nearImage(const RgbaImage& a, const RgbaImage& b, double eps = 1e-9) {
    if (a.width() != b.width() || a.height() != b.height()) {
        return false;
    }
    for (int y = 0; y < a.height(); ++y) {
        for (int x = 0; x < a.width(); ++x) {
            if (!nearPixel(a.getPixel(x, y), b.getPixel(x, y), eps)) {
                return false;
            }
        }
    }
    return true;
}

RgbaImage patternImage(int width, int height) {
    return RgbaImage(width, height, [](int x, int y) {
        return Rgba(static_cast<double>((x * 37 + y * 11) % 17) / 16.0,
                    static_cast<double>((x * 5 + y * 23) % 13) / 12.0,
                    static_cast<double>((x + y) % 7) / 6.0,
                    1.0);
    });
}

class ScriptedRandomSource : public RandomSource {
public:
    ScriptedRandomSource(double sample, bool firstCoin) : m_sample(sample), m_nextCoin(firstCoin) {}

    double uniform() override { return m_sample; }

    bool coin() override {
        const bool out = m_nextCoin;
        m_nextCoin = !m_nextCoin;
        return out;
    }

private:
    double m_sample;
    bool m_nextCoin;
};

void testRgbaArithmeticIsPerChannel() {
    const Rgba a(0.5, 0.25, 1.0, 0.5);
    const Rgba b(0.25, 0.5, 0.5, 1.0);

    require((a + b) == Rgba(0.75, 0.75, 1.5, 1.5), "Addition should include alpha");
    require((a - b) == Rgba(0.25, -0.25, 0.5, -0.5), "Subtraction should include alpha");
    require((a * b) == Rgba(0.125, 0.125, 0.5, 0.5), "Multiplication should be per channel");
    require((a / 2.0) == Rgba(0.25, 0.125, 0.5, 0.25), "Scalar division should be per channel");
    require(a.min(b) == Rgba(0.25, 0.25, 0.5, 0.5), "min should be per channel");
    require(a.max(b) == Rgba(0.5, 0.5, 1.0, 1.0), "max should be per channel");
    require(Rgba(-0.5, 0.5, -1.0, 1.0).abs() == Rgba(0.5, 0.5, 1.0, 1.0), "abs should be per channel");
    require(Rgba::gray(0.5) == Rgba::NEUTRAL_GRAY, "gray() should be opaque");
    require(Rgba::COLOURS.front() == Rgba::BLACK && Rgba::COLOURS.back() == Rgba::YELLOW,
            "Palette should run black to yellow");
}

void testGrayscaleReductionPreservesAlpha() {
    const Rgba out = Rgba(1.0, 1.0, 1.0, 0.5).grayscale();
    require(near(out.r, 1.0 / 3.0) && near(out.g, 1.0 / 3.0) && near(out.b, 1.0 / 3.0),
            "Grayscale should average the weighted channels");
    require(out.a == 0.5, "Grayscale should keep alpha");

    const Rgba red = Rgba::RED.grayscale();
    require(near(red.r, 0.1) && near(red.g, 0.1) && near(red.b, 0.1), "Red weighs 0.3 before averaging");
}

void testPixelOrderingIsLexicographic() {
    require(Rgba(0.1, 0.9, 0.9, 0.9) < Rgba(0.2, 0.0, 0.0, 0.0), "Red channel decides first");
    require(Rgba(0.1, 0.9, 0.2, 0.0) < Rgba(0.1, 0.0, 0.3, 0.0), "Blue decides before green");
    require(Rgba(0.1, 0.2, 0.5, 0.0) < Rgba(0.1, 0.3, 0.5, 0.0), "Green decides after equal red and blue");
    require(!(Rgba::gray(0.5) < Rgba::gray(0.5)), "Ordering should be strict");
}

void testImageConstructionAndBounds() {
    const RgbaImage image(3, 2, [](int x, int y) {
        return Rgba::gray(static_cast<double>(x + 10 * y) / 100.0);
    });
    require(image.width() == 3 && image.height() == 2, "Generator construction should keep dimensions");
    require(image.getPixel(2, 1) == Rgba::gray(0.12), "Generator should be evaluated per coordinate");

    const RgbaImage same = image.similar([](int, int) { return Rgba::RED; });
    require(same.width() == 3 && same.height() == 2, "similar() should keep dimensions");

    require(throwsAs([&image] { image.getPixel(3, 0); }, "out_of_range"), "x past the edge should throw");
    require(throwsAs([&image] { image.getPixel(0, -1); }, "out_of_range"), "negative y should throw");
    require(throwsAs([] { RgbaImage(-1, 2); }, "invalid_argument"), "Negative dimensions should throw");

    const RgbaImage empty = RgbaImage::black(0, 0);
    require(empty.width() == 0 && empty.height() == 0, "Zero-size canvases are allowed");
}

void testByteConversionScale() {
    const Rgba half = Rgba::fromBytes(128, 0, 255, 64);
    require(half == Rgba(0.5, 0.0, 255.0 / 256.0, 0.25), "Unpacking divides by 256");

    const std::array<std::uint8_t, 4> packed = Rgba(1.0, 0.5, -0.25, 2.0).toBytes();
    require(packed[0] == 255 && packed[1] == 128 && packed[2] == 0 && packed[3] == 255,
            "Packing clamps to [0,1], scales by 256 and truncates");
    require(Rgba::gray(0.999).toBytes()[0] == 255, "0.999 * 256 truncates to 255");
}

void testByteBufferLayoutIsRowMajor() {
    const std::vector<std::uint8_t> bytes = {
        0, 0, 0, 0, 64, 0, 0, 0,
        128, 0, 0, 0, 192, 0, 0, 0};
    const RgbaImage image = RgbaImage::fromBytes(2, 2, bytes);
    require(image.getPixel(1, 0).r == 0.25, "Second pixel of first row should be (1, 0)");
    require(image.getPixel(0, 1).r == 0.5, "Third pixel should start the second row");
    require(image.toBytes() == bytes, "Packing should use the same order as unpacking");

    require(throwsAs([] { RgbaImage::fromBytes(2, 2, std::vector<std::uint8_t>(15)); }, "invalid_argument"),
            "Byte buffer of the wrong length should throw");
}

void testByteRoundTripIsStable() {
    const RgbaImage original(16, 16, [](int x, int y) {
        const int k = (x * 16 + y) % 256;
        const double v = static_cast<double>(k) / 255.0;
        return Rgba(v, 1.0 - v, v, 1.0);
    });

    const std::vector<std::uint8_t> firstPack = original.toBytes();
    const RgbaImage firstUnpack = RgbaImage::fromBytes(16, 16, firstPack);
    require(nearImage(original, firstUnpack, 1.0 / 255.0), "Round trip should stay within one quantization step");

    const std::vector<std::uint8_t> secondPack = firstUnpack.toBytes();
    const RgbaImage secondUnpack = RgbaImage::fromBytes(16, 16, secondPack);
    require(firstPack == secondPack, "Second pack should reproduce the first");
    require(firstUnpack == secondUnpack, "Round trip should be idempotent");
}

void testEmptyPipelineIsIdentity() {
    const RgbaImage image = patternImage(7, 5);
    const Pipeline pipeline;
    require(pipeline.empty() && pipeline.stepCount() == 0, "Default pipeline should have no steps");
    require(pipeline.apply(image) == image, "Empty pipeline should return its input");
}

void testPipelineIsDeferredAndImmutable() {
    int runs = 0;
    const Pipeline base;
    const Pipeline counted = base.then([&runs](const RgbaImage& image) {
        ++runs;
        return image;
    });
    const Pipeline longer = counted.invert();

    require(runs == 0, "Declaring steps should not run them");
    require(base.stepCount() == 0, "Appending should not modify the receiver");
    require(counted.stepCount() == 1 && longer.stepCount() == 2, "Each append should return a longer pipeline");

    const RgbaImage image = patternImage(3, 3);
    const RgbaImage inverted = longer.apply(image);
    require(runs == 1, "apply() should run every step once");
    require(image == patternImage(3, 3), "apply() should not mutate its input");
    require(inverted.getPixel(0, 0) == Rgba::gray(1.0) - image.getPixel(0, 0), "invert should be 1 - value");

    const RgbaImage generated = Pipeline().generate(4, 2);
    require(generated == RgbaImage::black(4, 2), "generate() should start from a black canvas");
}

void testOffsetReplicatesEdges() {
    const RgbaImage row(3, 1, [](int x, int) {
        return Rgba::gray(static_cast<double>(x) / 2.0);
    });
    const RgbaImage shifted = Pipeline().offset(1, 0).apply(row);
    require(shifted.getPixel(0, 0) == Rgba::gray(0.5), "offset(1, 0) should read the right neighbour");
    require(shifted.getPixel(1, 0) == Rgba::gray(1.0), "offset(1, 0) should read the right neighbour");
    require(shifted.getPixel(2, 0) == Rgba::gray(1.0), "Reads past the edge should clamp");

    const RgbaImage back = Pipeline().offset(-5, 0).apply(row);
    require(back.getPixel(2, 0) == Rgba::gray(0.0), "Large negative offsets clamp to the first column");
}

void testOffsetRoundTripRestoresInterior() {
    const RgbaImage image = patternImage(6, 6);
    const RgbaImage restored = Pipeline().offset(1, 2).offset(-1, -2).apply(image);
    for (int y = 2; y < image.height(); ++y) {
        for (int x = 1; x < image.width(); ++x) {
            require(restored.getPixel(x, y) == image.getPixel(x, y), "Offset and its inverse should restore the interior");
        }
    }
}

void testDimComposes() {
    const RgbaImage image = patternImage(5, 4);
    const Rgba f1(0.5, 0.75, 2.0, 1.0);
    const Rgba f2(0.3, 1.5, 0.25, 0.5);
    const RgbaImage twice = Pipeline().dim(f1).dim(f2).apply(image);
    const RgbaImage once = Pipeline().dim(f1 * f2).apply(image);
    require(nearImage(twice, once, 1e-12), "dim(f1).dim(f2) should equal dim(f1 * f2)");
}

void testAddSubAndEnnoise() {
    const RgbaImage a(2, 2, Rgba(0.75, 0.75, 0.75, 0.5));
    const RgbaImage b(2, 2, Rgba(0.25, 0.25, 0.25, 1.0));

    const RgbaImage sum = Pipeline().add(Pipeline::constant(b)).apply(a);
    require(sum.getPixel(1, 1) == Rgba(1.0, 1.0, 1.0, 1.5), "add should combine every channel");

    const RgbaImage diff = Pipeline().sub(Pipeline::constant(b)).apply(a);
    require(diff.getPixel(0, 1) == Rgba(0.5, 0.5, 0.5, 0.5), "sub should keep the left alpha");

    const RgbaImage noise(2, 2, Rgba(0.75, 0.75, 0.75, 1.0));
    const RgbaImage noisy = Pipeline().ennoise(Pipeline::constant(noise)).apply(b);
    require(noisy.getPixel(0, 0) == Rgba(0.75, 0.75, 0.75, 1.0), "ennoise should add (noise - 0.5) * 2");

    const RgbaImage low = Pipeline().minWith(Pipeline::constant(b)).apply(a);
    require(low.getPixel(0, 0) == Rgba(0.25, 0.25, 0.25, 0.5), "minWith should take the channel minimum");
}

void testOperandsSeeTheCurrentRaster() {
    const RgbaImage image(2, 1, Rgba::gray(0.25));
    const RgbaImage doubled = Pipeline().add(Pipeline()).apply(image);
    require(doubled.getPixel(0, 0) == Rgba(0.5, 0.5, 0.5, 2.0), "An empty operand should echo its input");

    const RgbaImage chained = Pipeline().invert().add(Pipeline()).apply(image);
    require(chained.getPixel(1, 0) == Rgba(1.5, 1.5, 1.5, 0.0),
            "Operands should run on the raster produced by earlier steps");
}

void testConvolveUnitKernelIsIdentity() {
    const RgbaImage image = patternImage(6, 4);
    const Pipeline identity = Pipeline().convolve(1, 1, [](int, int) {
        return Rgba(1.0, 1.0, 1.0, 1.0);
    }, Pipeline::addCombinator());
    require(identity.apply(image) == image, "1x1 unit kernel should be the identity");
}

void testConvolveIsWeightedSumOfShiftedCopies() {
    const RgbaImage row(3, 1, [](int x, int) {
        return x == 1 ? Rgba::gray(1.0) : Rgba::gray(0.0);
    });
    const RgbaImage kernel(3, 1, [](int x, int) {
        const double w = x == 1 ? 0.5 : 0.25;
        return Rgba(w, w, w, w);
    });
    const RgbaImage out = Pipeline().convolveBy(kernel, Pipeline::addCombinator()).apply(row);
    require(out.getPixel(0, 0) == Rgba(0.25, 0.25, 0.25, 1.0), "Left pixel should pick up a quarter of the peak");
    require(out.getPixel(1, 0) == Rgba(0.5, 0.5, 0.5, 1.0), "Centre pixel should keep half the peak");
    require(out.getPixel(2, 0) == Rgba(0.25, 0.25, 0.25, 1.0), "Right pixel should pick up a quarter of the peak");

    require(throwsAs([] { Pipeline().convolve(0, 3, [](int, int) { return Rgba::WHITE; }, Pipeline::addCombinator()); },
                     "invalid_argument"),
            "Kernels without cells should be rejected");
}

void testMedianApproximation() {
    const RgbaImage uniform(4, 4, Rgba::gray(0.3));
    require(Pipeline().filter(Filter::median(3)).apply(uniform) == uniform,
            "Median of a uniform raster should be unchanged");

    const RgbaImage row(3, 1, [](int x, int) {
        return Rgba::gray(x == 1 ? 1.0 : (x == 0 ? 0.0 : 0.5));
    });
    const RgbaImage out = Pipeline().filter(Filter::median(3)).apply(row);
    require(out.getPixel(1, 0) == Rgba::gray(0.5), "Median approximation averages the window min and max");

    require(throwsAs([] { Filter::median(0); }, "invalid_argument"), "Median size must be positive");
}

void testKernelNeedles() {
    const Filter average = Generator(3).averageNeedle();
    require(average.isConvoluted(), "Average needle should be a convolution filter");
    const RgbaImage averageKernel = average.needle().generate(0, 0);
    require(averageKernel.width() == 3 && averageKernel.height() == 3, "Needle should ignore the requested size");
    require(averageKernel.getPixel(2, 1) == Rgba::gray(1.0 / 9.0), "Average weights should be 1 / (size * size)");

    const RgbaImage gauss = Generator(5).gaussianNeedle(0.6).needle().generate(0, 0);
    require(gauss.getPixel(2, 2) == Rgba::gray(gaussianDensity(0.0, 0.0, 0.6)), "Centre should hold the peak density");
    require(gauss.getPixel(0, 2) == gauss.getPixel(2, 0) && gauss.getPixel(2, 0) == gauss.getPixel(4, 2),
            "Gaussian needle should be radially symmetric");
    require(gauss.getPixel(1, 1).r < gauss.getPixel(1, 2).r, "Weights should fall off with distance");

    require(throwsAs([] { Filter::gaussian(4, 0.6); }, "invalid_argument"), "Even kernel sizes should be rejected");
    require(throwsAs([] { Generator(0).averageNeedle(); }, "invalid_argument"), "Zero kernel size should be rejected");
    require(throwsAs([] { Filter::median(3).needle(); }, "logic_error"), "Median filters have no needle");
}

void testAverageBlurKeepsUniformRaster() {
    const RgbaImage uniform(5, 5, Rgba::gray(0.5));
    const RgbaImage blurred = Pipeline().filter(Filter::average(3)).apply(uniform);
    for (int y = 0; y < 5; ++y) {
        for (int x = 0; x < 5; ++x) {
            require(near(blurred.getPixel(x, y).r, 0.5, 1e-12), "Average blur should keep a uniform colour");
        }
    }
}

void testGaussianBlurIgnoresItsArguments() {
    const RgbaImage image = patternImage(6, 6);
    const RgbaImage viaBlur = Pipeline().gaussianBlur(9, 3.0).apply(image);
    const RgbaImage viaFilter = Pipeline().filter(Filter::gaussian(5, 0.6)).apply(image);
    require(viaBlur == viaFilter, "gaussianBlur should always use a 5x5 kernel of variance 0.6");
}

void testGrayscaleStepWeightsTwice() {
    const RgbaImage white(1, 1, Rgba::WHITE);
    const Rgba out = Pipeline().grayscale().apply(white).getPixel(0, 0);
    const double expected = (0.3 * 0.3 + 0.59 * 0.59 + 0.11 * 0.11) / 3.0;
    require(near(out.r, expected) && near(out.g, expected) && near(out.b, expected),
            "Grayscale step should apply the luminance weights twice");
    require(out.a == 1.0, "Grayscale step should keep alpha");
}

void testGradientOfConstantRasterIsBlack() {
    const RgbaImage black = RgbaImage::black(3, 3);
    const RgbaImage out = Pipeline().grayscale().gradient().apply(black);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            const Rgba& px = out.getPixel(x, y);
            require(px.r == 0.0 && px.g == 0.0 && px.b == 0.0, "Constant input should have zero gradient");
        }
    }
}

void testGradientRespondsToStep() {
    const RgbaImage step(4, 1, [](int x, int) {
        return x >= 2 ? Rgba::gray(1.0) : Rgba::gray(0.0);
    });
    const RgbaImage out = Pipeline().gradient().apply(step);
    require(out.getPixel(0, 0).r == 0.0, "Flat region should have no gradient");
    require(out.getPixel(1, 0).r == 1.0, "Pixel left of the step should see it");
    require(out.getPixel(2, 0).r == 1.0, "Pixel right of the step should see it");
    require(out.getPixel(3, 0).r == 0.0, "Clamped edge should have no gradient");

    require(throwsAs([] { detail::gradientKernel(3, 0); }, "logic_error"),
            "Gradient kernel should reject indices outside 3x3");
}

void testNonMaxSuppressionOnMonotonicRaster() {
    const RgbaImage ramp(5, 5, [](int x, int y) {
        return Rgba::gray(static_cast<double>(x + y) / 10.0);
    });
    const RgbaImage out = Pipeline().nonMaxSuppress().apply(ramp);
    for (int y = 1; y < 4; ++y) {
        for (int x = 1; x < 4; ++x) {
            require(out.getPixel(x, y) == Rgba::BLACK, "Interior of a monotonic ramp should be suppressed");
        }
    }
    // At the far corner both anti-diagonal neighbours are inside and darker;
    // at the near corner they are brighter and every other triple clamps onto
    // the centre itself.
    require(out.getPixel(4, 4) == Rgba::gray(0.8), "Far corner is a peak along the anti-diagonal");
    require(out.getPixel(0, 0) == Rgba::BLACK, "Near corner should be suppressed");
}

void testNonMaxSuppressionKeepsPeaks() {
    RgbaImage peak(3, 3, [](int x, int y) {
        return x == 1 && y == 1 ? Rgba::gray(0.8) : Rgba::gray(0.2);
    });
    const RgbaImage out = Pipeline().nonMaxSuppress().apply(peak);
    require(out.getPixel(1, 1) == Rgba::gray(0.8), "Local maximum should be kept");
    require(out.getPixel(0, 0) == Rgba::BLACK, "Non-maximum should be suppressed");
    require(out.getPixel(2, 1) == Rgba::BLACK, "Non-maximum should be suppressed");

    const RgbaImage colour(3, 3, [](int x, int y) {
        return x == 1 && y == 1 ? Rgba(0.5, 0.9, 0.2, 1.0) : Rgba(0.5, 0.1, 0.3, 1.0);
    });
    require(Pipeline().nonMaxSuppress().apply(colour).getPixel(1, 1) == Rgba::BLACK,
            "Blue outranks green when comparing colour pixels");
}

void testQuantizeUsesInvertedLevels() {
    const Pipeline single = Pipeline().quantize({0.5});
    require(single.apply(RgbaImage(2, 2, Rgba::gray(0.5))).getPixel(0, 0) == Rgba::gray(0.0),
            "Meeting the only threshold maps to level 0");
    require(single.apply(RgbaImage(2, 2, Rgba::gray(0.4))).getPixel(1, 1) == Rgba::gray(1.0),
            "Falling below every threshold maps to level 1");

    const Pipeline two = Pipeline().quantize({0.2, 0.6});
    require(two.apply(RgbaImage(1, 1, Rgba::gray(0.7))).getPixel(0, 0) == Rgba::gray(0.0), "Above 0.6 maps to 0");
    require(two.apply(RgbaImage(1, 1, Rgba::gray(0.3))).getPixel(0, 0) == Rgba::gray(0.5), "Between maps to 0.5");
    require(two.apply(RgbaImage(1, 1, Rgba::gray(0.1))).getPixel(0, 0) == Rgba::gray(1.0), "Below 0.2 maps to 1");

    const Rgba transparentRed(0.9, 0.0, 0.0, 0.0);
    require(single.apply(RgbaImage(1, 1, transparentRed)).getPixel(0, 0) == Rgba::gray(1.0),
            "Intensity should average r, g and b only");

    require(throwsAs([] { Pipeline().quantize({}); }, "invalid_argument"), "Empty threshold list should be rejected");
}

void testCannyFindsVerticalLine() {
    const RgbaImage line(9, 9, [](int x, int) {
        return x == 4 ? Rgba::WHITE : Rgba::BLACK;
    });
    const RgbaImage edges = Pipeline().canny({0.1}).apply(line);
    require(edges.width() == 9 && edges.height() == 9, "Edge detection should keep dimensions");
    for (int y = 0; y < 9; ++y) {
        require(edges.getPixel(3, y) == Rgba::gray(0.0), "Left flank of the line should be an edge");
        require(edges.getPixel(5, y) == Rgba::gray(0.0), "Right flank of the line should be an edge");
        require(edges.getPixel(4, y) == Rgba::gray(1.0), "Line centre has no gradient");
        require(edges.getPixel(0, y) == Rgba::gray(1.0), "Background should not be an edge");
    }

    const RgbaImage flat = Pipeline().canny({0.1}).apply(RgbaImage(4, 4, Rgba::gray(0.6)));
    require(flat == RgbaImage(4, 4, Rgba::gray(1.0)), "Uniform input should have no edges");
}

void testGaussianDensity() {
    require(near(gaussianDensity(0.0, 0.0, 1.0), 0.3989422804014327), "Standard normal peak");
    require(near(gaussianDensity(0.0, 0.0, 4.0), 0.19947114020071635), "Third argument is a variance, not sigma");
    require(near(gaussianDensity(2.0, 1.0, 4.0), gaussianDensity(0.0, 1.0, 4.0)), "Density is symmetric about the mean");
    require(throwsAs([] { gaussianDensity(0.0, 0.0, 0.0); }, "invalid_argument"), "Zero variance should be rejected");
}

void testGaussianNoiseWithScriptedSource() {
    const double variance = 1.0 / (2.0 * 3.14159265358979323846);
    auto random = std::make_shared<ScriptedRandomSource>(0.5, true);
    const Pipeline noise = Generator(3, random).gaussianNoise(0.5, variance, 0.25);
    const RgbaImage out = noise.apply(RgbaImage(2, 1, Rgba::RED));
    require(nearPixel(out.getPixel(0, 0), Rgba::gray(0.75)), "Heads should push the gray up");
    require(nearPixel(out.getPixel(1, 0), Rgba::gray(0.25)), "Tails should push the gray down");
}

void testSaltAndPepperValues() {
    auto random = std::make_shared<MersenneRandomSource>(1234u);
    const RgbaImage out = Generator(100, random).saltAndPepperNoise(0.1).generate(100, 100);

    int white = 0;
    int black = 0;
    int gray = 0;
    for (int y = 0; y < out.height(); ++y) {
        for (int x = 0; x < out.width(); ++x) {
            const Rgba& px = out.getPixel(x, y);
            if (px == Rgba::WHITE) {
                ++white;
            } else if (px == Rgba::BLACK) {
                ++black;
            } else if (px == Rgba::NEUTRAL_GRAY) {
                ++gray;
            } else {
                require(false, "Impulse noise should only emit 0.0, 0.5 or 1.0");
            }
        }
    }
    require(white > 0 && black > 0 && gray > 0, "All three impulse levels should occur");
    require(white + black + gray == 10000, "Every pixel should be classified");
}

void testSeededNoiseIsReproducible() {
    const RgbaImage a = patternImage(8, 8);
    const RgbaImage b(8, 8, Rgba::CYAN);
    const RgbaImage first = Generator(3, std::make_shared<MersenneRandomSource>(42u))
                                .gaussianNoise(0.5, 0.2, 0.7).apply(a);
    const RgbaImage second = Generator(3, std::make_shared<MersenneRandomSource>(42u))
                                 .gaussianNoise(0.5, 0.2, 0.7).apply(b);
    require(first == second, "Noise should depend only on the random source and dimensions");

    require(throwsAs([] { Generator(3, nullptr); }, "invalid_argument"), "Generators need a random source");
}

void testNoiseCopiesApplyConcurrently() {
    auto shared = std::make_shared<MersenneRandomSource>(1u);
    const Pipeline first = Generator(3, shared).gaussianNoise(0.5, 0.2, 0.7);
    const Pipeline second = first;

    RgbaImage a;
    RgbaImage b;
    std::thread left([&first, &a] { a = first.generate(64, 64); });
    std::thread right([&second, &b] { b = second.generate(64, 64); });
    left.join();
    right.join();

    const double limit = gaussianDensity(0.5, 0.5, 0.2) * 0.7;
    for (const RgbaImage* image : {&a, &b}) {
        require(image->width() == 64 && image->height() == 64, "Concurrent noise should keep dimensions");
        for (int y = 0; y < 64; ++y) {
            for (int x = 0; x < 64; ++x) {
                const Rgba& px = image->getPixel(x, y);
                require(px.r == px.g && px.g == px.b && std::abs(px.r - 0.5) <= limit + 1e-12,
                        "Concurrent noise pixels should stay in the Gaussian noise range");
            }
        }
    }

    // Every pixel took exactly one uniform draw and one coin from the shared
    // engine, so it must end where a sequential replay ends.
    MersenneRandomSource replay(1u);
    for (int i = 0; i < 2 * 64 * 64; ++i) {
        replay.uniform();
        replay.coin();
    }
    require(replay.uniform() == shared->uniform(), "Concurrent draws should not be lost or torn");
}

void writeBMPHeader(const std::string& path, std::int32_t width, std::int32_t height) {
    std::vector<std::uint8_t> header(54, 0);
    const auto put = [&header](std::size_t at, std::uint32_t value, int bytes) {
        for (int i = 0; i < bytes; ++i) {
            header[at + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
        }
    };
    put(0, 0x4D42, 2);
    put(2, 54, 4);
    put(10, 54, 4);
    put(14, 40, 4);
    put(18, static_cast<std::uint32_t>(width), 4);
    put(22, static_cast<std::uint32_t>(height), 4);
    put(26, 1, 2);
    put(28, 32, 2);

    std::ofstream out(path, std::ios::binary);
    require(static_cast<bool>(out), "Failed to open BMP header file for writing");
    out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
}

void testBMPRejectsHostileHeaders() {
    std::filesystem::create_directories(kTestOutDir);
    const std::string path = kTestOutDir + "/hostile.bmp";

    writeBMPHeader(path, std::numeric_limits<std::int32_t>::max(), 1);
    require(throwsAs([&path] { loadBMP(path); }, "runtime_error"), "Row size overflow should be rejected");

    writeBMPHeader(path, 20000, 20000);
    require(throwsAs([&path] { loadBMP(path); }, "runtime_error"), "Oversized images should be rejected before allocation");

    writeBMPHeader(path, 4, std::numeric_limits<std::int32_t>::min());
    require(throwsAs([&path] { loadBMP(path); }, "runtime_error"), "Unrepresentable top-down height should be rejected");

    writeBMPHeader(path, 2, 2);
    require(throwsAs([&path] { loadBMP(path); }, "runtime_error"), "Missing pixel data should be rejected");
}

void testBMPRoundtripKeepsBytes() {
    std::filesystem::create_directories(kTestOutDir);
    const std::string path = kTestOutDir + "/roundtrip.bmp";

    std::vector<std::uint8_t> bytes;
    for (int i = 0; i < 5 * 3; ++i) {
        bytes.push_back(static_cast<std::uint8_t>(i * 17));
        bytes.push_back(static_cast<std::uint8_t>(255 - i * 13));
        bytes.push_back(static_cast<std::uint8_t>(i * 7));
        bytes.push_back(static_cast<std::uint8_t>(100 + i));
    }
    const RgbaImage image = RgbaImage::fromBytes(5, 3, bytes);
    require(saveBMP(image, path), "Saving BMP should succeed");

    const RgbaImage loaded = loadBMP(path);
    require(loaded.width() == 5 && loaded.height() == 3, "BMP should keep dimensions");
    require(loaded.toBytes() == bytes, "BMP round trip should keep every byte including alpha");

    require(throwsAs([] { loadBMP(kTestOutDir + "/does-not-exist.bmp"); }, "runtime_error"),
            "Missing BMP should throw");
}

void testOptionParsing() {
    require(oddKernelSize(4) == 5 && oddKernelSize(5) == 5 && oddKernelSize(1) == 1, "Kernel sizes round up to odd");

    const std::vector<double> thresholds = parseThresholds("0.2,0.5");
    require(thresholds.size() == 2 && thresholds[0] == 0.2 && thresholds[1] == 0.5, "Threshold list should parse");
    require(parseThresholds("") == std::vector<double>{0.0}, "Missing thresholds default to 0.0");
    require(throwsAs([] { parseThresholds("0.2,x"); }, "runtime_error"), "Malformed thresholds should throw");

    std::string name;
    std::string value;
    splitOption("--median=3", name, value);
    require(name == "--median" && value == "3", "Options split at '='");
    splitOption("--grayscale", name, value);
    require(name == "--grayscale" && value.empty(), "Flags have no value");

    const RgbaImage image = patternImage(4, 4);
    auto random = std::make_shared<MersenneRandomSource>(7u);
    const Pipeline gray = applyOption(Pipeline(), "--grayscale", image, random);
    require(gray.apply(image) == Pipeline().grayscale().apply(image), "--grayscale should map to grayscale()");

    const Pipeline blur = applyOption(Pipeline(), "--average-blur=2", image, random);
    require(blur.apply(image) == Pipeline().filter(Filter::average(3)).apply(image),
            "--average-blur=2 should use a 3x3 kernel");

    require(throwsAs([&] { applyOption(Pipeline(), "--sharpen", image, random); }, "runtime_error"),
            "Unknown options should throw");
    require(throwsAs([&] { applyOption(Pipeline(), "--median=abc", image, random); }, "runtime_error"),
            "Malformed sizes should throw");
    require(throwsAs([&] { applyOption(Pipeline(), "--gaussian-noise=0", image, random); }, "runtime_error"),
            "Zero noise variance should throw");
}

void testOptionsMatchDirectPipelines() {
    const RgbaImage image = patternImage(6, 4);
    const auto seeded = [](std::uint32_t seed) {
        return std::make_shared<MersenneRandomSource>(seed);
    };

    require(applyOption(Pipeline(), "--gaussian-blur=4", image, seeded(1u)).apply(image) ==
                Pipeline().filter(Filter::gaussian(5, 5.0 / 10.0 + 0.1)).apply(image),
            "--gaussian-blur=4 should use a 5x5 kernel of variance size / 10 + 0.1");

    require(applyOption(Pipeline(), "--gaussian-noise=4", image, seeded(11u)).apply(image) ==
                Pipeline().ennoise(Generator(6, seeded(11u)).gaussianNoise(0.5, 1.0 / 4.0, 0.7)).apply(image),
            "--gaussian-noise=V should add noise of mean 0.5, variance 1 / V and intensity 0.7");

    require(applyOption(Pipeline(), "--impulse-noise=0.4", image, seeded(12u)).apply(image) ==
                Pipeline().ennoise(Generator(6, seeded(12u)).saltAndPepperNoise(0.4)).apply(image),
            "--impulse-noise=V should add salt-and-pepper noise of variance V");

    require(applyOption(Pipeline(), "--canny=0.2,0.5", image, seeded(1u)).apply(image) ==
                Pipeline().canny({0.2, 0.5}).apply(image),
            "--canny should pass its threshold list through");
    require(applyOption(Pipeline(), "--canny", image, seeded(1u)).apply(image) ==
                Pipeline().canny({0.0}).apply(image),
            "--canny without thresholds should use 0.0");

    const Pipeline chained = buildPipeline({"--invert", "--grayscale"}, image, seeded(1u));
    require(chained.apply(image) == Pipeline().invert().grayscale().apply(image), "Options should apply left to right");
}

void testParseCommandLineReadsOpsFileAndSeed() {
    std::filesystem::create_directories(kTestOutDir);
    const std::string opsPath = kTestOutDir + "/ops.txt";
    {
        std::ofstream out(opsPath);
        require(static_cast<bool>(out), "Failed to open ops file for writing");
        out << "# denoise first\n"
               "  --median=3  \n"
               "\n"
               "--seed=9\n";
    }

    const CommandLine cmd = parseCommandLine({"rasterflow", "in.bmp", "out.bmp",
                                              "--ops-file=" + opsPath, "--canny=0.3"});
    require(cmd.sourcePath == "in.bmp" && cmd.destinationPath == "out.bmp", "Paths come first");
    require(cmd.hasSeed && cmd.seed == 9u, "Seed can come from the ops file");
    require(cmd.options.size() == 2 && cmd.options[0] == "--median=3" && cmd.options[1] == "--canny=0.3",
            "Ops file lines should be spliced in place with comments dropped");

    require(throwsAs([] { parseCommandLine({"rasterflow", "in.bmp"}); }, "runtime_error"),
            "Destination is required");
}

void testRunCommandEndToEnd() {
    std::filesystem::create_directories(kTestOutDir);
    const std::string inPath = kTestOutDir + "/cli_in.bmp";
    const std::string outPath = kTestOutDir + "/cli_out.bmp";

    const RgbaImage source(6, 4, [](int x, int) {
        return x < 3 ? Rgba::BLUE : Rgba::YELLOW;
    });
    require(saveBMP(source, inPath), "Saving CLI input should succeed");

    const int status = runCommand({"rasterflow", inPath, outPath, "--seed=3", "--impulse-noise=0.4",
                                   "--median=3", "--grayscale"});
    require(status == 0, "CLI run should succeed");

    const RgbaImage result = loadBMP(outPath);
    require(result.width() == 6 && result.height() == 4, "CLI output should keep dimensions");
    for (int y = 0; y < result.height(); ++y) {
        for (int x = 0; x < result.width(); ++x) {
            const Rgba& px = result.getPixel(x, y);
            require(px.r == px.g && px.g == px.b, "Grayscale output should have equal colour channels");
        }
    }
}
} // namespace

int main() {
    try {
        testRgbaArithmeticIsPerChannel();
        testGrayscaleReductionPreservesAlpha();
        testPixelOrderingIsLexicographic();
        testImageConstructionAndBounds();
        testByteConversionScale();
        testByteBufferLayoutIsRowMajor();
        testByteRoundTripIsStable();
        testEmptyPipelineIsIdentity();
        testPipelineIsDeferredAndImmutable();
        testOffsetReplicatesEdges();
        testOffsetRoundTripRestoresInterior();
        testDimComposes();
        testAddSubAndEnnoise();
        testOperandsSeeTheCurrentRaster();
        testConvolveUnitKernelIsIdentity();
        testConvolveIsWeightedSumOfShiftedCopies();
        testMedianApproximation();
        testKernelNeedles();
        testAverageBlurKeepsUniformRaster();
        testGaussianBlurIgnoresItsArguments();
        testGrayscaleStepWeightsTwice();
        testGradientOfConstantRasterIsBlack();
        testGradientRespondsToStep();
        testNonMaxSuppressionOnMonotonicRaster();
        testNonMaxSuppressionKeepsPeaks();
        testQuantizeUsesInvertedLevels();
        testCannyFindsVerticalLine();
        testGaussianDensity();
        testGaussianNoiseWithScriptedSource();
        testSaltAndPepperValues();
        testSeededNoiseIsReproducible();
        testNoiseCopiesApplyConcurrently();
        testBMPRejectsHostileHeaders();
        testBMPRoundtripKeepsBytes();
        testOptionParsing();
        testOptionsMatchDirectPipelines();
        testParseCommandLineReadsOpsFileAndSeed();
        testRunCommandEndToEnd();

        std::cout << "All tests passed\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Test failure: " << ex.what() << "\n";
        return 1;
    }
}
