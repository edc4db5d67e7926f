#include "print_config.h"

#include "status.h"
#include "transport_session.h"

namespace booth_printer {

Status PrintConfig::Validate()
{
    if (printer_width == 0) {
        return Status(StatusCode::kInvalidArgument,
                      "Printer width must be non-zero");
    }
    if (chunk_size == 0) {
        return Status(StatusCode::kInvalidArgument,
                      "Chunk size must be non-zero");
    }
    if (chunk_delay.count() < 0 || copy_delay.count() < 0) {
        return Status(StatusCode::kInvalidArgument,
                      "Delays cannot be negative");
    }
    if (write_timeout.count() <= 0) {
        return Status(StatusCode::kInvalidArgument,
                      "Write timeout must be positive");
    }
    if (!(contrast > 0.0f) || !(brightness > 0.0f)) {
        return Status(StatusCode::kInvalidArgument,
                      "Contrast and brightness must be positive");
    }
    return Status(StatusCode::kStatusOk);
}

TransportOptions PrintConfig::transport_options()
{
    TransportOptions options;
    options.chunk_size = chunk_size;
    options.chunk_delay = chunk_delay;
    options.write_timeout = write_timeout;
    return options;
}

};
