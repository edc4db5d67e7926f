#include "raster_image.h"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "status.h"

namespace booth_printer {

std::expected<RasterImage, Status>
    RasterImage::Create(std::vector<uint8_t> data, uint32_t width,
                        uint32_t height)
{
    if (width == 0 || height == 0) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Image has a zero dimension"));
    }

    size_t expected_size = static_cast<size_t>(width) * height * kBytesPerPixel;
    if (data.size() != expected_size) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Image buffer is " + std::to_string(data.size()) +
                " bytes, expected " + std::to_string(expected_size)));
    }

    return RasterImage(std::move(data), width, height);
}

std::expected<RasterImage, Status>
    RasterImage::Filled(uint32_t width, uint32_t height, Rgba color)
{
    std::vector<uint8_t> data(static_cast<size_t>(width) * height *
                              kBytesPerPixel);
    for (size_t i = 0; i < data.size(); i += kBytesPerPixel) {
        data[i] = color.r;
        data[i + 1] = color.g;
        data[i + 2] = color.b;
        data[i + 3] = color.a;
    }
    return Create(std::move(data), width, height);
}

size_t MonoRaster::CountBlack() const
{
    return std::count(dots_.begin(), dots_.end(), true);
}

};
