#include "frame_encoder.h"

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include "raster_image.h"
#include "status.h"
#include "utils.h"

namespace booth_printer {

namespace {

constexpr uint8_t kEsc = 0x1b;
constexpr uint8_t kGs = 0x1d;
constexpr uint32_t kMaxHeaderField = 0xffff;

enum class RasterImageMode : uint8_t {
    /* The printers we ship with only accept 0x00 here, not ASCII '0'. */
    kNormal = 0x00,
};

enum class CutMode : uint8_t {
    kPartial = 0x01,
};

void AppendInit(std::vector<uint8_t> &out)
{
    out.insert(out.end(), {kEsc, 0x40});
}

void AppendRasterHeader(std::vector<uint8_t> &out, uint16_t bytes_x,
                        uint16_t dots_y)
{
    /* For simplicity, just always do normal mode. Both fields little-endian. */
    out.insert(out.end(), {kGs, 0x76, 0x30,
                           static_cast<uint8_t>(RasterImageMode::kNormal),
                           static_cast<uint8_t>(bytes_x & 0xff),
                           static_cast<uint8_t>(bytes_x >> 8),
                           static_cast<uint8_t>(dots_y & 0xff),
                           static_cast<uint8_t>(dots_y >> 8)});
}

void AppendRows(std::vector<uint8_t> &out, const MonoRaster &mono,
                uint32_t bytes_x)
{
    for (uint32_t y = 0; y < mono.height(); y++) {
        for (uint32_t bx = 0; bx < bytes_x; bx++) {
            uint8_t byte = 0;
            for (uint32_t bit = 0; bit < 8; bit++) {
                uint32_t x = bx * 8 + bit;
                /* Padding past the right edge stays 0 (no print). */
                if (x < mono.width() && mono.black(x, y)) {
                    byte |= static_cast<uint8_t>(0x80 >> bit);
                }
            }
            out.push_back(byte);
        }
    }
}

void AppendFeed(std::vector<uint8_t> &out, uint8_t lines)
{
    out.insert(out.end(), {kEsc, 0x64, lines});
}

void AppendCut(std::vector<uint8_t> &out)
{
    out.insert(out.end(), {kGs, 0x56, static_cast<uint8_t>(CutMode::kPartial)});
}

};

std::expected<PrintFrame, Status> Encode(const MonoRaster &mono,
                                         uint8_t feed_lines)
{
    constexpr size_t kInitSize = 2;
    constexpr size_t kHeaderSize = 8;
    constexpr size_t kTrailerSize = 6;

    /*
     * The width is in terms of pixels. The raster format encodes 8 pixels in 1
     * byte, so round the width up to whole bytes.
     */
    uint32_t bytes_x = DIV_ROUND_UP(mono.width(), 8u);
    if (bytes_x > kMaxHeaderField || mono.height() > kMaxHeaderField) {
        return std::unexpected(Status(StatusCode::kFrameTooLarge,
                "Raster of " + std::to_string(mono.width()) + "x" +
                std::to_string(mono.height()) +
                " dots does not fit the 16-bit raster header"));
    }

    std::vector<uint8_t> out;
    out.reserve(kInitSize + kHeaderSize +
                static_cast<size_t>(bytes_x) * mono.height() + kTrailerSize);

    AppendInit(out);
    AppendRasterHeader(out, static_cast<uint16_t>(bytes_x),
                       static_cast<uint16_t>(mono.height()));
    AppendRows(out, mono, bytes_x);
    AppendFeed(out, feed_lines);
    AppendCut(out);

    DB_PRINT("%s: %zu-byte frame for %ux%u raster\n", __func__, out.size(),
             mono.width(), mono.height());
    DB_PRINT_ARRAY(out.data(), kInitSize + kHeaderSize);

    return PrintFrame(std::move(out), mono.width(), mono.height());
}

};
