#include "thermal_printer.h"

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "ditherer.h"
#include "frame_encoder.h"
#include "print_config.h"
#include "rasterizer.h"
#include "status.h"
#include "utils.h"

namespace booth_printer {

std::expected<std::unique_ptr<ThermalPrinter>, Status>
        ThermalPrinter::Create(std::unique_ptr<PrinterChannel> channel,
                               PrintConfig config)
{
    if (!channel) {
        return std::unexpected(Status(StatusCode::kInvalidArgument,
                                      "No printer channel given"));
    }

    Status status = config.Validate();
    if (!status.Ok()) {
        status.prepend_message("Bad print config: ");
        return std::unexpected(status);
    }

    return std::make_unique<ThermalPrinter>(std::move(channel), config);
}

std::expected<PrintFrame, Status>
        ThermalPrinter::BuildFrame(const RasterImage &image)
{
    auto resampled = Resample(image, config_.printer_width);
    if (!resampled.has_value()) {
        return std::unexpected(resampled.error());
    }

    RasterImage toned = AdjustTone(*resampled, config_.contrast,
                                   config_.brightness);
    MonoRaster mono = Dither(toned, config_.dither);
    return Encode(mono, config_.feed_lines);
}

Status ThermalPrinter::PrintImage(const RasterImage &image, uint32_t copies)
{
    if (copies == 0) {
        return Status(StatusCode::kInvalidArgument,
                      "At least one copy must be requested");
    }

    std::unique_lock<std::mutex> lock(mu_printer_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return Status(StatusCode::kBusy, "Printer is busy with another job");
    }

    /* Encoding is deterministic, so every copy can share one frame. */
    auto frame = BuildFrame(image);
    if (!frame.has_value()) {
        return frame.error();
    }

    for (uint32_t copy = 0; copy < copies; copy++) {
        if (copy > 0 && config_.copy_delay.count() > 0) {
            std::this_thread::sleep_for(config_.copy_delay);
        }

        Status status = session_.Send(*frame);
        if (!status.Ok()) {
            status.prepend_message("Copy " + std::to_string(copy + 1) + "/" +
                                   std::to_string(copies) + ": ");
            return status;
        }
        DB_PRINT("%s: copy %u/%u done\n", __func__, copy + 1, copies);
    }

    return Status(StatusCode::kStatusOk);
}

};
