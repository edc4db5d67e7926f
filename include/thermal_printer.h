#ifndef THERMAL_PRINTER_H
#define THERMAL_PRINTER_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <utility>

#include "frame_encoder.h"
#include "print_config.h"
#include "printer_channel.h"
#include "printer_interface.h"
#include "raster_image.h"
#include "status.h"
#include "transport_session.h"

namespace booth_printer {

struct PrintJob {
    RasterImage image;
    uint32_t copies = 1;
};

/*
 * ESC/POS raster printer on a single channel. Runs the whole pipeline,
 * resample -> tone -> dither -> encode -> send, for one job at a time.
 */
class ThermalPrinter : public PrinterInterface {
  public:
    static std::expected<std::unique_ptr<ThermalPrinter>, Status>
       Create(std::unique_ptr<PrinterChannel> channel, PrintConfig config);

    ThermalPrinter(std::unique_ptr<PrinterChannel> channel,
                   PrintConfig config) :
        config_(config),
        session_(std::move(channel), config.transport_options()) {}

    /*
     * Copies go out strictly one after another with config.copy_delay in
     * between. Stops at the first copy that fails. Returns kBusy if another
     * job is running on this printer.
     */
    Status PrintImage(const RasterImage &image, uint32_t copies) override;
    Status Print(const PrintJob &job) { return PrintImage(job.image,
                                                          job.copies); }

    /* Everything up to, but not including, the transport. */
    std::expected<PrintFrame, Status> BuildFrame(const RasterImage &image);

    /* Progress of the current or most recent copy. */
    SessionState state() const { return session_.state(); }
    size_t chunks_sent() const { return session_.chunks_sent(); }

  private:
    PrintConfig config_;
    TransportSession session_;
    std::mutex mu_printer_;
};

};

#endif
