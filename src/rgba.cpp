#include "rgba.h"

#include <algorithm>
#include <cmath>

namespace {
double clamp01(double v) {
    if (v < 0.0) {
        return 0.0;
    }
    if (v > 1.0) {
        return 1.0;
    }
    return v;
}

std::uint8_t toByte(double unit) {
    const double scaled = std::floor(clamp01(unit) * 256.0);
    return static_cast<std::uint8_t>(std::min(255.0, scaled));
}
} // namespace

const Rgba Rgba::BLACK(0.0, 0.0, 0.0, 1.0);
const Rgba Rgba::RED(1.0, 0.0, 0.0, 1.0);
const Rgba Rgba::VIOLET(1.0, 0.0, 1.0, 1.0);
const Rgba Rgba::BLUE(0.0, 0.0, 1.0, 1.0);
const Rgba Rgba::CYAN(0.0, 1.0, 1.0, 1.0);
const Rgba Rgba::GREEN(0.0, 1.0, 0.0, 1.0);
const Rgba Rgba::YELLOW(1.0, 1.0, 0.0, 1.0);
const Rgba Rgba::WHITE(1.0, 1.0, 1.0, 1.0);
const Rgba Rgba::NEUTRAL_GRAY(0.5, 0.5, 0.5, 1.0);
const Rgba Rgba::GRAYSCALE_FACTOR(0.3, 0.59, 0.11, 1.0);
const std::array<Rgba, 7> Rgba::COLOURS = {
    Rgba(0.0, 0.0, 0.0, 1.0),
    Rgba(1.0, 0.0, 0.0, 1.0),
    Rgba(1.0, 0.0, 1.0, 1.0),
    Rgba(0.0, 0.0, 1.0, 1.0),
    Rgba(0.0, 1.0, 1.0, 1.0),
    Rgba(0.0, 1.0, 0.0, 1.0),
    Rgba(1.0, 1.0, 0.0, 1.0)};

Rgba Rgba::gray(double value) {
    return Rgba(value, value, value, 1.0);
}

Rgba Rgba::fromBytes(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a) {
    return Rgba(static_cast<double>(r) / 256.0,
                static_cast<double>(g) / 256.0,
                static_cast<double>(b) / 256.0,
                static_cast<double>(a) / 256.0);
}

Rgba Rgba::withAlpha(double alpha) const {
    return Rgba(r, g, b, alpha);
}

Rgba Rgba::map(const std::function<double(double)>& f) const {
    return Rgba(f(r), f(g), f(b), f(a));
}

Rgba Rgba::abs() const {
    return Rgba(std::abs(r), std::abs(g), std::abs(b), std::abs(a));
}

Rgba Rgba::min(const Rgba& other) const {
    return Rgba(std::min(r, other.r), std::min(g, other.g), std::min(b, other.b), std::min(a, other.a));
}

Rgba Rgba::max(const Rgba& other) const {
    return Rgba(std::max(r, other.r), std::max(g, other.g), std::max(b, other.b), std::max(a, other.a));
}

Rgba Rgba::grayscale() const {
    const Rgba weighted = (*this) * GRAYSCALE_FACTOR;
    return gray((weighted.r + weighted.g + weighted.b) / 3.0).withAlpha(weighted.a);
}

std::array<std::uint8_t, 4> Rgba::toBytes() const {
    return {toByte(r), toByte(g), toByte(b), toByte(a)};
}

Rgba operator+(const Rgba& lhs, const Rgba& rhs) {
    return Rgba(lhs.r + rhs.r, lhs.g + rhs.g, lhs.b + rhs.b, lhs.a + rhs.a);
}

Rgba operator-(const Rgba& lhs, const Rgba& rhs) {
    return Rgba(lhs.r - rhs.r, lhs.g - rhs.g, lhs.b - rhs.b, lhs.a - rhs.a);
}

Rgba operator*(const Rgba& lhs, const Rgba& rhs) {
    return Rgba(lhs.r * rhs.r, lhs.g * rhs.g, lhs.b * rhs.b, lhs.a * rhs.a);
}

Rgba operator/(const Rgba& lhs, double rhs) {
    return Rgba(lhs.r / rhs, lhs.g / rhs, lhs.b / rhs, lhs.a / rhs);
}

bool operator==(const Rgba& lhs, const Rgba& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

bool operator!=(const Rgba& lhs, const Rgba& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Rgba& lhs, const Rgba& rhs) {
    if (lhs.r != rhs.r) {
        return lhs.r < rhs.r;
    }
    if (lhs.b != rhs.b) {
        return lhs.b < rhs.b;
    }
    if (lhs.g != rhs.g) {
        return lhs.g < rhs.g;
    }
    return lhs.a < rhs.a;
}
