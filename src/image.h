#ifndef IMAGE_H
#define IMAGE_H

#include "rgba.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

// Upper bound on width * height for any raster, including decoded files.
constexpr std::size_t kMaxImagePixels = 100000000;

// Read-only raster contract. Pipelines are written against the members
// RgbaImage adds on top of it (blank canvas, generator construction, similar)
// so another raster representation only has to supply the same set.
class Image {
public:
    virtual ~Image() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual bool inBounds(int x, int y) const = 0;
    virtual const Rgba& getPixel(int x, int y) const = 0;
};

class RgbaImage : public Image {
public:
    using PixelFunction = std::function<Rgba(int, int)>;

    RgbaImage();
    RgbaImage(int width, int height, const Rgba& fill = Rgba::BLACK);
    RgbaImage(int width, int height, const PixelFunction& f);

    static RgbaImage black(int width, int height);

    // Row-major, four bytes (r, g, b, a) per pixel, channel = byte / 256.
    static RgbaImage fromBytes(int width, int height, const std::vector<std::uint8_t>& bytes);
    std::vector<std::uint8_t> toBytes() const;

    RgbaImage similar(const PixelFunction& f) const;

    int width() const override;
    int height() const override;
    bool inBounds(int x, int y) const override;
    const Rgba& getPixel(int x, int y) const override;

    // Edge-replicating lookup: coordinates are clamped into the raster.
    const Rgba& getPixelClamped(int x, int y) const;

private:
    int m_width;
    int m_height;
    std::vector<Rgba> m_pixels;
};

bool operator==(const RgbaImage& lhs, const RgbaImage& rhs);
bool operator!=(const RgbaImage& lhs, const RgbaImage& rhs);

#endif
