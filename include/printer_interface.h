#ifndef PRINTER_INTERFACE_H
#define PRINTER_INTERFACE_H

#include <cstdint>

#include "raster_image.h"
#include "status.h"

namespace booth_printer {

class PrinterInterface {
  public:
    virtual ~PrinterInterface() = default;

    /* Prints copies of an already composited image, one after the other. */
    virtual Status PrintImage(const RasterImage &image, uint32_t copies) = 0;
};

};

#endif
