#include "image.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace {
std::size_t pixelIndex(int x, int y, int width) {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
}

std::size_t checkedPixelCount(int width, int height, const char* context) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument(std::string(context) + " dimensions must not be negative");
    }
    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    if (h != 0 && w > std::numeric_limits<std::size_t>::max() / h) {
        throw std::invalid_argument(std::string(context) + " dimensions overflow pixel count");
    }
    const std::size_t pixels = w * h;
    if (pixels > kMaxImagePixels) {
        throw std::invalid_argument(std::string(context) + " exceeds maximum pixel count");
    }
    return pixels;
}
} // namespace

RgbaImage::RgbaImage() : m_width(0), m_height(0) {}

RgbaImage::RgbaImage(int width, int height, const Rgba& fill)
    : m_width(width), m_height(height), m_pixels(checkedPixelCount(width, height, "Image"), fill) {}

RgbaImage::RgbaImage(int width, int height, const PixelFunction& f)
    : m_width(width), m_height(height) {
    m_pixels.reserve(checkedPixelCount(width, height, "Image"));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            m_pixels.push_back(f(x, y));
        }
    }
}

RgbaImage RgbaImage::black(int width, int height) {
    return RgbaImage(width, height, Rgba::BLACK);
}

RgbaImage RgbaImage::fromBytes(int width, int height, const std::vector<std::uint8_t>& bytes) {
    const std::size_t pixels = checkedPixelCount(width, height, "Byte buffer");
    if (bytes.size() != pixels * 4) {
        throw std::invalid_argument("Byte buffer holds " + std::to_string(bytes.size()) +
                                    " bytes, expected " + std::to_string(pixels * 4));
    }
    return RgbaImage(width, height, [&bytes, width](int x, int y) {
        const std::size_t i = pixelIndex(x, y, width) * 4;
        return Rgba::fromBytes(bytes[i], bytes[i + 1], bytes[i + 2], bytes[i + 3]);
    });
}

std::vector<std::uint8_t> RgbaImage::toBytes() const {
    std::vector<std::uint8_t> out;
    out.reserve(m_pixels.size() * 4);
    for (const Rgba& px : m_pixels) {
        const std::array<std::uint8_t, 4> bytes = px.toBytes();
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

RgbaImage RgbaImage::similar(const PixelFunction& f) const {
    return RgbaImage(m_width, m_height, f);
}

int RgbaImage::width() const {
    return m_width;
}

int RgbaImage::height() const {
    return m_height;
}

bool RgbaImage::inBounds(int x, int y) const {
    return x >= 0 && x < m_width && y >= 0 && y < m_height;
}

const Rgba& RgbaImage::getPixel(int x, int y) const {
    if (!inBounds(x, y)) {
        throw std::out_of_range("Pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") out of bounds for " +
                                std::to_string(m_width) + "x" + std::to_string(m_height) + " image");
    }
    return m_pixels[pixelIndex(x, y, m_width)];
}

const Rgba& RgbaImage::getPixelClamped(int x, int y) const {
    if (m_width <= 0 || m_height <= 0) {
        throw std::out_of_range("Cannot sample an empty image");
    }
    const int cx = std::max(0, std::min(x, m_width - 1));
    const int cy = std::max(0, std::min(y, m_height - 1));
    return m_pixels[pixelIndex(cx, cy, m_width)];
}

bool operator==(const RgbaImage& lhs, const RgbaImage& rhs) {
    if (lhs.width() != rhs.width() || lhs.height() != rhs.height()) {
        return false;
    }
    for (int y = 0; y < lhs.height(); ++y) {
        for (int x = 0; x < lhs.width(); ++x) {
            if (lhs.getPixel(x, y) != rhs.getPixel(x, y)) {
                return false;
            }
        }
    }
    return true;
}

bool operator!=(const RgbaImage& lhs, const RgbaImage& rhs) {
    return !(lhs == rhs);
}
