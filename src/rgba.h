#ifndef RGBA_H
#define RGBA_H

#include <array>
#include <cstdint>
#include <functional>

// Linear floating-point colour. Channels are nominally in [0,1] but may leave
// that range in intermediate results; clamping happens only at byte conversion.
struct Rgba {
    double r;
    double g;
    double b;
    double a;

    Rgba() : r(0.0), g(0.0), b(0.0), a(0.0) {}
    Rgba(double red, double green, double blue, double alpha)
        : r(red), g(green), b(blue), a(alpha) {}

    static const Rgba BLACK;
    static const Rgba RED;
    static const Rgba VIOLET;
    static const Rgba BLUE;
    static const Rgba CYAN;
    static const Rgba GREEN;
    static const Rgba YELLOW;
    static const Rgba WHITE;
    static const Rgba NEUTRAL_GRAY;
    static const Rgba GRAYSCALE_FACTOR;
    static const std::array<Rgba, 7> COLOURS;

    static Rgba gray(double value);
    static Rgba fromBytes(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t a);

    Rgba withAlpha(double alpha) const;
    Rgba map(const std::function<double(double)>& f) const;
    Rgba abs() const;
    Rgba min(const Rgba& other) const;
    Rgba max(const Rgba& other) const;

    // Weights by GRAYSCALE_FACTOR, then spreads the mean of r/g/b over all
    // three colour channels. Alpha is kept.
    Rgba grayscale() const;

    // Clamped to [0,1], scaled by 256 and truncated.
    std::array<std::uint8_t, 4> toBytes() const;
};

Rgba operator+(const Rgba& lhs, const Rgba& rhs);
Rgba operator-(const Rgba& lhs, const Rgba& rhs);
Rgba operator*(const Rgba& lhs, const Rgba& rhs);
Rgba operator/(const Rgba& lhs, double rhs);

bool operator==(const Rgba& lhs, const Rgba& rhs);
bool operator!=(const Rgba& lhs, const Rgba& rhs);
// Lexicographic over (r, b, g, a): blue is compared before green.
bool operator<(const Rgba& lhs, const Rgba& rhs);

#endif
