#ifndef RASTER_IMAGE_H
#define RASTER_IMAGE_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "status.h"

namespace booth_printer {

/* Color image, 4 bytes per pixel in R, G, B, A order, rows top to bottom. */
class RasterImage {
  public:
    static constexpr size_t kBytesPerPixel = 4;

    typedef struct Rgba {
        uint8_t r;
        uint8_t g;
        uint8_t b;
        uint8_t a;
    } __attribute__((packed)) Rgba;

    /* Fails with kInvalidImage unless data.size() == width * height * 4. */
    static std::expected<RasterImage, Status>
        Create(std::vector<uint8_t> data, uint32_t width, uint32_t height);

    /* Solid image, mostly useful for tests and padding. */
    static std::expected<RasterImage, Status>
        Filled(uint32_t width, uint32_t height, Rgba color);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    std::span<const uint8_t> data() const { return data_; }

    const Rgba &pixel(uint32_t x, uint32_t y) const
    {
        return *reinterpret_cast<const Rgba *>(
                &data_[(static_cast<size_t>(y) * width_ + x) * kBytesPerPixel]);
    }

  private:
    RasterImage(std::vector<uint8_t> data, uint32_t width, uint32_t height) :
        data_(std::move(data)),
        width_(width),
        height_(height) {}

    std::vector<uint8_t> data_;
    uint32_t width_;
    uint32_t height_;
};

/*
 * 1-bit image, one entry per pixel, true meaning "print a black dot".
 * Produced by the ditherer and read-only afterwards.
 */
class MonoRaster {
  public:
    MonoRaster(std::vector<bool> dots, uint32_t width, uint32_t height) :
        dots_(std::move(dots)),
        width_(width),
        height_(height) {}

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    bool black(uint32_t x, uint32_t y) const
    {
        return dots_[static_cast<size_t>(y) * width_ + x];
    }

    size_t CountBlack() const;

  private:
    std::vector<bool> dots_;
    uint32_t width_;
    uint32_t height_;
};

};

#endif
