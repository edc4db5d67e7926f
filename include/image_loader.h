#ifndef IMAGE_LOADER_H
#define IMAGE_LOADER_H

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "raster_image.h"
#include "status.h"

namespace booth_printer {

/*
 * Decodes any format ImageMagick knows into an opaque RasterImage (first
 * frame only, flattened onto white). Needs the identify and convert tools
 * on the PATH.
 *
 * With rotate_landscape, images wider than they are tall are turned 90
 * degrees so they print at a higher resolution.
 */
std::expected<RasterImage, Status> LoadImage(const std::string &path,
                                             bool rotate_landscape);

/*
 * Reads a headerless RGBA dump. Its dimensions cannot be determined from the
 * file, but they can if the width is known.
 */
std::expected<RasterImage, Status> LoadRawRgba(const std::string &path,
                                               uint32_t width);

std::expected<std::vector<uint8_t>, Status> ReadFile(const std::string &path);

};

#endif
