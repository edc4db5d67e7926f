#ifndef TRANSPORT_SESSION_H
#define TRANSPORT_SESSION_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "frame_encoder.h"
#include "printer_channel.h"
#include "status.h"

namespace booth_printer {

/* A slice [offset, offset + length) of a frame. */
struct TransportChunk {
    size_t offset;
    size_t length;
};

/*
 * Splits frame_size bytes into consecutive chunks of chunk_size bytes, the
 * last one possibly shorter. chunk_size must be non-zero.
 */
std::vector<TransportChunk> PartitionFrame(size_t frame_size,
                                           size_t chunk_size);

struct TransportOptions {
    /*
     * Well below the link's payload limit. The printer has no flow control,
     * so bigger chunks overrun its buffer.
     */
    size_t chunk_size = 512;
    /* The printer drains its buffer slower than the link fills it. */
    std::chrono::milliseconds chunk_delay{50};
    std::chrono::milliseconds write_timeout{5000};
};

enum class SessionState {
    kIdle,
    kSending,
    kComplete,
    kFailed,
};

/*
 * Sends whole frames over a channel it owns, one chunk at a time. Each chunk
 * write must finish before the next starts, since the printer has no
 * reassembly buffer. A failed frame is never resumed: the printer's state
 * after half a raster command is undefined, so callers start a new job.
 */
class TransportSession {
  public:
    TransportSession(std::unique_ptr<PrinterChannel> channel,
                     TransportOptions options) :
        channel_(std::move(channel)),
        options_(options) {}

    /*
     * Idle -> Sending -> Complete | Failed. Returns kNotConnected if the
     * channel is down before the first chunk, kDisconnected if it goes down
     * later, kTransportError for any other write failure (timeouts included)
     * and kBusy if another Send() on this session has not finished yet.
     */
    Status Send(const PrintFrame &frame);

    /* State of the current or most recent job. */
    SessionState state() const { return state_; }
    size_t chunks_sent() const { return chunks_sent_; }
    size_t bytes_sent() const { return bytes_sent_; }

  private:
    Status Fail(Status status);

    std::unique_ptr<PrinterChannel> channel_;
    const TransportOptions options_;
    /* Held for the whole job; Send() only ever try-locks it. */
    std::mutex mu_send_;
    std::atomic<SessionState> state_{SessionState::kIdle};
    std::atomic<size_t> chunks_sent_{0};
    std::atomic<size_t> bytes_sent_{0};
};

};

#endif
