#include "bmp.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
#pragma pack(push, 1)
struct BMPFileHeader {
    std::uint16_t fileType;
    std::uint32_t fileSize;
    std::uint16_t reserved1;
    std::uint16_t reserved2;
    std::uint32_t offsetData;
};

struct BMPInfoHeader {
    std::uint32_t headerSize;
    std::int32_t width;
    std::int32_t height;
    std::uint16_t planes;
    std::uint16_t bitCount;
    std::uint32_t compression;
    std::uint32_t imageSize;
    std::int32_t xPixelsPerMeter;
    std::int32_t yPixelsPerMeter;
    std::uint32_t colorsUsed;
    std::uint32_t colorsImportant;
};
#pragma pack(pop)

constexpr std::uint16_t kBMPMagic = 0x4D42;
constexpr std::uint32_t kBI_RGB = 0;

std::size_t paddedRowSize(int width, int bytesPerPixel) {
    const std::size_t rowStride = static_cast<std::size_t>(width) * static_cast<std::size_t>(bytesPerPixel);
    return (rowStride + 3) & ~static_cast<std::size_t>(3);
}
} // namespace

bool saveBMP(const RgbaImage& image, const std::string& filename) {
    const int width = image.width();
    const int height = image.height();
    if (width <= 0 || height <= 0) {
        return false;
    }

    std::ofstream out(filename, std::ios::binary);
    if (!out) {
        return false;
    }

    const std::size_t rowSize = paddedRowSize(width, 4);
    const std::uint32_t imageSize = static_cast<std::uint32_t>(rowSize * static_cast<std::size_t>(height));

    BMPFileHeader fileHeader{};
    fileHeader.fileType = kBMPMagic;
    fileHeader.fileSize = static_cast<std::uint32_t>(sizeof(BMPFileHeader) + sizeof(BMPInfoHeader)) + imageSize;
    fileHeader.offsetData = static_cast<std::uint32_t>(sizeof(BMPFileHeader) + sizeof(BMPInfoHeader));

    BMPInfoHeader infoHeader{};
    infoHeader.headerSize = sizeof(BMPInfoHeader);
    infoHeader.width = width;
    infoHeader.height = height;
    infoHeader.planes = 1;
    infoHeader.bitCount = 32;
    infoHeader.compression = kBI_RGB;
    infoHeader.imageSize = imageSize;

    out.write(reinterpret_cast<const char*>(&fileHeader), sizeof(fileHeader));
    out.write(reinterpret_cast<const char*>(&infoHeader), sizeof(infoHeader));

    const std::vector<std::uint8_t> rgba = image.toBytes();
    for (int y = height - 1; y >= 0; --y) {
        for (int x = 0; x < width; ++x) {
            const std::size_t i = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
            const std::uint8_t bgra[4] = {rgba[i + 2], rgba[i + 1], rgba[i], rgba[i + 3]};
            out.write(reinterpret_cast<const char*>(bgra), 4);
        }
    }

    return static_cast<bool>(out);
}

RgbaImage loadBMP(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open BMP file: " + filename);
    }

    BMPFileHeader fileHeader{};
    BMPInfoHeader infoHeader{};

    in.read(reinterpret_cast<char*>(&fileHeader), sizeof(fileHeader));
    in.read(reinterpret_cast<char*>(&infoHeader), sizeof(infoHeader));

    if (!in) {
        throw std::runtime_error("Failed to read BMP headers");
    }
    if (fileHeader.fileType != kBMPMagic) {
        throw std::runtime_error("Not a BMP file: " + filename);
    }
    if (infoHeader.headerSize < sizeof(BMPInfoHeader)) {
        throw std::runtime_error("Unsupported BMP info header size");
    }
    if ((infoHeader.bitCount != 24 && infoHeader.bitCount != 32) || infoHeader.compression != kBI_RGB) {
        throw std::runtime_error("Only uncompressed 24-bit or 32-bit BMP is supported");
    }
    if (infoHeader.width <= 0 || infoHeader.height == 0 ||
        infoHeader.height == std::numeric_limits<std::int32_t>::min()) {
        throw std::runtime_error("Invalid BMP dimensions");
    }

    const int width = infoHeader.width;
    const bool topDown = infoHeader.height < 0;
    const int height = topDown ? -infoHeader.height : infoHeader.height;
    const int bytesPerPixel = infoHeader.bitCount / 8;

    if (static_cast<std::size_t>(width) > kMaxImagePixels / static_cast<std::size_t>(height)) {
        throw std::runtime_error("BMP dimensions " + std::to_string(width) + "x" + std::to_string(height) +
                                 " exceed the maximum pixel count");
    }

    const std::size_t pixels = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    const std::size_t rowSize = paddedRowSize(width, bytesPerPixel);
    std::vector<std::uint8_t> row(rowSize);
    std::vector<std::uint8_t> rgba(pixels * 4);

    in.seekg(fileHeader.offsetData, std::ios::beg);

    for (int fileY = 0; fileY < height; ++fileY) {
        in.read(reinterpret_cast<char*>(row.data()), static_cast<std::streamsize>(rowSize));
        if (!in) {
            throw std::runtime_error("Unexpected end of BMP pixel data");
        }

        const int y = topDown ? fileY : (height - 1 - fileY);
        for (int x = 0; x < width; ++x) {
            const std::size_t s = static_cast<std::size_t>(x) * static_cast<std::size_t>(bytesPerPixel);
            const std::size_t d = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
            rgba[d] = row[s + 2];
            rgba[d + 1] = row[s + 1];
            rgba[d + 2] = row[s];
            rgba[d + 3] = bytesPerPixel == 4 ? row[s + 3] : 255;
        }
    }

    return RgbaImage::fromBytes(width, height, rgba);
}
