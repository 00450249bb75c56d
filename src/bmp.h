#ifndef BMP_H
#define BMP_H

#include "image.h"

#include <string>

// Uncompressed BI_RGB bitmaps. Reads 24- and 32-bit files, bottom-up or
// top-down; writes 32-bit BGRA bottom-up so alpha survives a round trip.
RgbaImage loadBMP(const std::string& filename);
bool saveBMP(const RgbaImage& image, const std::string& filename);

#endif
