#ifndef PRINT_CONFIG_H
#define PRINT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "ditherer.h"
#include "frame_encoder.h"
#include "status.h"
#include "transport_session.h"

namespace booth_printer {

/*
 * Hardware tuning. The defaults were measured on an MP-58A1 (58 mm head,
 * 384 dots at 203 dpi); other ESC/POS printers will likely want different
 * delays.
 */
struct PrintConfig {
    uint32_t printer_width = 384;
    uint8_t feed_lines = kDefaultFeedLines;
    size_t chunk_size = 512;
    std::chrono::milliseconds chunk_delay{50};
    /* Lets the mechanism finish and settle before the next copy. */
    std::chrono::milliseconds copy_delay{3000};
    std::chrono::milliseconds write_timeout{5000};
    float contrast = 1.1f;
    float brightness = 1.1f;
    DitherAlgorithm dither = DitherAlgorithm::kFloydSteinberg;

    Status Validate();
    TransportOptions transport_options();
};

};

#endif
