#ifndef DITHERER_H
#define DITHERER_H

#include <cstdint>
#include <string_view>

#include "raster_image.h"

namespace booth_printer {

enum class DitherAlgorithm {
    kFloydSteinberg,
    /* Spreads only 3/4 of the error, which keeps line art crisper. */
    kAtkinson,
};

/*
 * Converts the image to 1 bit with error diffusion over the luminance
 * L = 0.299 R + 0.587 G + 0.114 B. Values below 128 print black. The alpha
 * channel is ignored, so callers must composite onto white beforehand
 * (Resample() does).
 *
 * Pixels are visited strictly in raster order. No state is shared between
 * calls, so different images can be dithered on different threads.
 */
MonoRaster Dither(const RasterImage &image,
                  DitherAlgorithm algorithm = DitherAlgorithm::kFloydSteinberg);

bool ParseDitherAlgorithm(std::string_view name, DitherAlgorithm *algorithm);

};

#endif
