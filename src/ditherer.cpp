#include "ditherer.h"

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "raster_image.h"
#include "utils.h"

namespace booth_printer {

namespace {

constexpr float kThreshold = 128.0f;
constexpr float kWhite = 255.0f;
constexpr float kBlack = 0.0f;

/* Where a fraction of the quantization error goes, relative to (x, y). */
struct ErrorTap {
    int32_t dx;
    int32_t dy;
    float weight;
};

/*
 * Floyd Steinberg.
 * .... .... ....
 * .... curr 7/16
 * 3/16 5/16 1/16
 */
constexpr ErrorTap kFloydSteinbergTaps[] = {
    { 1, 0, 7.0f / 16.0f},
    {-1, 1, 3.0f / 16.0f},
    { 0, 1, 5.0f / 16.0f},
    { 1, 1, 1.0f / 16.0f},
};

/*
 * Atkinson.
 * ... ... ... ...
 * ... cur 1/8 1/8
 * 1/8 1/8 1/8 ...
 * ... 1/8 ... ...
 */
constexpr ErrorTap kAtkinsonTaps[] = {
    { 1, 0, 1.0f / 8.0f},
    { 2, 0, 1.0f / 8.0f},
    {-1, 1, 1.0f / 8.0f},
    { 0, 1, 1.0f / 8.0f},
    { 1, 1, 1.0f / 8.0f},
    { 0, 2, 1.0f / 8.0f},
};

float Luminance(const RasterImage::Rgba &p)
{
    float l = 0.299f * p.r + 0.587f * p.g + 0.114f * p.b;
    return std::clamp(l, kBlack, kWhite);
}

template <size_t N>
MonoRaster Diffuse(const RasterImage &image, const ErrorTap (&taps)[N])
{
    const int32_t width = image.width();
    const int32_t height = image.height();

    /* Working copy of the luminance; neighbours accumulate error in it. */
    std::vector<float> work(static_cast<size_t>(width) * height);
    for (int32_t y = 0; y < height; y++) {
        for (int32_t x = 0; x < width; x++) {
            work[static_cast<size_t>(y) * width + x] =
                Luminance(image.pixel(x, y));
        }
    }

    std::vector<bool> dots(work.size(), false);
    for (int32_t y = 0; y < height; y++) {
        for (int32_t x = 0; x < width; x++) {
            size_t i = static_cast<size_t>(y) * width + x;
            /*
             * Error pushed into a white pixel cannot make it whiter than
             * paper. Negative values are kept.
             */
            float old_pixel = std::min(work[i], kWhite);
            float new_pixel = old_pixel < kThreshold ? kBlack : kWhite;
            float err = old_pixel - new_pixel;

            dots[i] = new_pixel == kBlack;

            for (const ErrorTap &tap : taps) {
                int32_t nx = x + tap.dx;
                int32_t ny = y + tap.dy;
                /* No wraparound; error off the edge is dropped. */
                if (nx < 0 || nx >= width || ny >= height) {
                    continue;
                }
                work[static_cast<size_t>(ny) * width + nx] += err * tap.weight;
            }
        }
    }

    return MonoRaster(std::move(dots), image.width(), image.height());
}

};

MonoRaster Dither(const RasterImage &image, DitherAlgorithm algorithm)
{
    DB_PRINT("Dithering %ux%u image\n", image.width(), image.height());

    switch (algorithm) {
    case DitherAlgorithm::kAtkinson:
        return Diffuse(image, kAtkinsonTaps);
    case DitherAlgorithm::kFloydSteinberg:
    default:
        return Diffuse(image, kFloydSteinbergTaps);
    }
}

bool ParseDitherAlgorithm(std::string_view name, DitherAlgorithm *algorithm)
{
    if (name == "floyd-steinberg" || name == "fs") {
        *algorithm = DitherAlgorithm::kFloydSteinberg;
        return true;
    }
    if (name == "atkinson") {
        *algorithm = DitherAlgorithm::kAtkinson;
        return true;
    }
    return false;
}

};
