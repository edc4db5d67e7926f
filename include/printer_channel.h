#ifndef PRINTER_CHANNEL_H
#define PRINTER_CHANNEL_H

#include <chrono>
#include <cstdint>
#include <span>

#include "status.h"

namespace booth_printer {

/*
 * An already-open link to the printer. Discovery and pairing happen
 * elsewhere; all the driver needs is to know whether the link is up and to
 * push bytes through it in order.
 */
class PrinterChannel {
  public:
    virtual ~PrinterChannel() = default;

    virtual bool IsConnected() = 0;

    /*
     * Blocks until all of data has been accepted by the link. Returns
     * kTimeout if that takes longer than timeout.
     */
    virtual Status Write(std::span<const uint8_t> data,
                         std::chrono::milliseconds timeout) = 0;
};

};

#endif
