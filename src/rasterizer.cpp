#include "rasterizer.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "raster_image.h"
#include "status.h"
#include "utils.h"

namespace booth_printer {

namespace {

constexpr size_t kChannels = 3;

/* Source pixels covered by one output pixel along one axis. */
struct Coverage {
    uint32_t first;
    std::vector<float> weights;
};

/*
 * Output pixel o covers the source interval [o * scale, (o + 1) * scale).
 * Weights are the overlap with each source pixel, normalized to sum to 1.
 */
std::vector<Coverage> ComputeCoverage(uint32_t src_size, uint32_t dst_size)
{
    std::vector<Coverage> coverage(dst_size);
    const double scale = static_cast<double>(src_size) / dst_size;

    for (uint32_t o = 0; o < dst_size; o++) {
        double start = o * scale;
        double end = std::min((o + 1) * scale, static_cast<double>(src_size));
        uint32_t first = static_cast<uint32_t>(start);
        uint32_t last = std::min(static_cast<uint32_t>(std::ceil(end)),
                                 src_size);

        Coverage &c = coverage[o];
        c.first = first;
        for (uint32_t s = first; s < last; s++) {
            double overlap = std::min(end, s + 1.0) -
                             std::max(start, static_cast<double>(s));
            c.weights.push_back(static_cast<float>(overlap / scale));
        }
    }
    return coverage;
}

uint8_t ToByte(float value)
{
    return static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

};

std::expected<RasterImage, Status> Resample(const RasterImage &image,
                                            uint32_t target_width)
{
    const uint32_t src_w = image.width();
    const uint32_t src_h = image.height();

    if (src_w == 0 || src_h == 0 ||
        image.data().size() != static_cast<size_t>(src_w) * src_h *
                               RasterImage::kBytesPerPixel) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Cannot resample an empty or malformed image"));
    }
    if (target_width == 0) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Target width must be non-zero"));
    }

    uint64_t scaled = static_cast<uint64_t>(target_width) * src_h / src_w;
    if (scaled > UINT32_MAX) {
        return std::unexpected(Status(StatusCode::kInvalidImage,
                "Resampled image height does not fit in 32 bits"));
    }
    uint32_t target_height = std::max<uint64_t>(scaled, 1);

    DB_PRINT("Resampling %ux%u to %ux%u\n", src_w, src_h, target_width,
             target_height);

    /*
     * Horizontal pass: src_w x src_h -> target_width x src_h. Each source row
     * is composited over white on its own, so alpha is gone after this and
     * only one row of the source is ever held as floats.
     */
    std::vector<Coverage> cols = ComputeCoverage(src_w, target_width);
    std::vector<float> row(static_cast<size_t>(src_w) * kChannels);
    std::vector<float> horiz(static_cast<size_t>(target_width) * src_h *
                             kChannels, 0.0f);
    for (uint32_t y = 0; y < src_h; y++) {
        for (uint32_t x = 0; x < src_w; x++) {
            const RasterImage::Rgba &p = image.pixel(x, y);
            float alpha = p.a / 255.0f;
            float *out = &row[static_cast<size_t>(x) * kChannels];
            out[0] = p.r * alpha + 255.0f * (1.0f - alpha);
            out[1] = p.g * alpha + 255.0f * (1.0f - alpha);
            out[2] = p.b * alpha + 255.0f * (1.0f - alpha);
        }

        float *out_row = &horiz[static_cast<size_t>(y) * target_width *
                                kChannels];
        for (uint32_t x = 0; x < target_width; x++) {
            const Coverage &c = cols[x];
            for (size_t k = 0; k < c.weights.size(); k++) {
                const float *p = &row[(c.first + k) * kChannels];
                for (size_t ch = 0; ch < kChannels; ch++) {
                    out_row[x * kChannels + ch] += p[ch] * c.weights[k];
                }
            }
        }
    }

    /* Vertical pass: target_width x src_h -> target_width x target_height. */
    std::vector<Coverage> rows = ComputeCoverage(src_h, target_height);
    std::vector<uint8_t> out(static_cast<size_t>(target_width) *
                             target_height * RasterImage::kBytesPerPixel);
    std::vector<float> acc(static_cast<size_t>(target_width) * kChannels);
    for (uint32_t y = 0; y < target_height; y++) {
        std::fill(acc.begin(), acc.end(), 0.0f);
        const Coverage &c = rows[y];
        for (size_t k = 0; k < c.weights.size(); k++) {
            const float *src_row = &horiz[(c.first + k) * target_width *
                                          kChannels];
            for (size_t i = 0; i < acc.size(); i++) {
                acc[i] += src_row[i] * c.weights[k];
            }
        }

        uint8_t *out_row = &out[static_cast<size_t>(y) * target_width *
                                RasterImage::kBytesPerPixel];
        for (uint32_t x = 0; x < target_width; x++) {
            out_row[x * 4] = ToByte(acc[x * kChannels]);
            out_row[x * 4 + 1] = ToByte(acc[x * kChannels + 1]);
            out_row[x * 4 + 2] = ToByte(acc[x * kChannels + 2]);
            out_row[x * 4 + 3] = 0xff;
        }
    }

    return RasterImage::Create(std::move(out), target_width, target_height);
}

RasterImage AdjustTone(const RasterImage &image, float contrast,
                       float brightness)
{
    uint8_t lut[256];
    for (int v = 0; v < 256; v++) {
        /* Each filter clamps its own output before the next one runs. */
        float c = std::clamp((v / 255.0f - 0.5f) * contrast + 0.5f,
                             0.0f, 1.0f);
        lut[v] = ToByte(c * brightness * 255.0f);
    }

    std::span<const uint8_t> src = image.data();
    std::vector<uint8_t> data(src.begin(), src.end());
    for (size_t i = 0; i < data.size(); i += RasterImage::kBytesPerPixel) {
        data[i] = lut[data[i]];
        data[i + 1] = lut[data[i + 1]];
        data[i + 2] = lut[data[i + 2]];
    }

    /* Same dimensions as a valid image, so this cannot fail. */
    return *RasterImage::Create(std::move(data), image.width(),
                                image.height());
}

};
