#ifndef RASTERIZER_H
#define RASTERIZER_H

#include <cstdint>
#include <expected>

#include "raster_image.h"
#include "status.h"

namespace booth_printer {

/*
 * Scales the image to target_width dots, keeping the aspect ratio:
 * height = floor(target_width * src_height / src_width), at least 1.
 * Every output pixel is the area-weighted average of the source pixels it
 * covers, after compositing them over white, so the result is opaque.
 */
std::expected<RasterImage, Status> Resample(const RasterImage &image,
                                            uint32_t target_width);

/*
 * Per-channel contrast and brightness, in that order, like the CSS filters
 * the kiosk used to apply before printing. 1.0 leaves the channel as is.
 */
RasterImage AdjustTone(const RasterImage &image, float contrast,
                       float brightness);

};

#endif
