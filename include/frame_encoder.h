#ifndef FRAME_ENCODER_H
#define FRAME_ENCODER_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include "raster_image.h"
#include "status.h"

namespace booth_printer {

class PrintFrame;

constexpr uint8_t kDefaultFeedLines = 2;

/*
 * Packs the raster into a PrintFrame. Fails with kFrameTooLarge when the row
 * width in bytes or the height does not fit the header's 16-bit fields.
 */
std::expected<PrintFrame, Status> Encode(const MonoRaster &mono,
                                         uint8_t feed_lines = kDefaultFeedLines);

/*
 * Complete command stream for one printout:
 *   ESC @                      init
 *   GS v 0 m xL xH yL yH       raster header, x in bytes, y in dots
 *   rows, MSB is the leftmost dot
 *   ESC d n                    feed
 *   GS V 1                     partial cut
 */
class PrintFrame {
  public:
    std::span<const uint8_t> data() const { return bytes_; }
    size_t size() const { return bytes_.size(); }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

  private:
    friend std::expected<PrintFrame, Status> Encode(const MonoRaster &mono,
                                                    uint8_t feed_lines);

    PrintFrame(std::vector<uint8_t> bytes, uint32_t width, uint32_t height) :
        bytes_(std::move(bytes)),
        width_(width),
        height_(height) {}

    std::vector<uint8_t> bytes_;
    uint32_t width_;
    uint32_t height_;
};

};

#endif
