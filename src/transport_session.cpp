#include "transport_session.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "frame_encoder.h"
#include "printer_channel.h"
#include "status.h"
#include "utils.h"

namespace booth_printer {

std::vector<TransportChunk> PartitionFrame(size_t frame_size,
                                           size_t chunk_size)
{
    std::vector<TransportChunk> chunks;
    if (chunk_size == 0) {
        return chunks;
    }

    chunks.reserve(DIV_ROUND_UP(frame_size, chunk_size));
    for (size_t offset = 0; offset < frame_size; offset += chunk_size) {
        chunks.push_back({offset, std::min(chunk_size, frame_size - offset)});
    }
    return chunks;
}

Status TransportSession::Fail(Status status)
{
    state_ = SessionState::kFailed;
    DB_PRINT("%s: job failed after %zu chunks: %s\n", __func__,
             chunks_sent_.load(), status.message().c_str());
    return status;
}

Status TransportSession::Send(const PrintFrame &frame)
{
    std::unique_lock<std::mutex> lock(mu_send_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return Status(StatusCode::kBusy,
                      "A frame is already being sent on this channel");
    }

    /* Every job starts over from Idle. */
    state_ = SessionState::kIdle;
    chunks_sent_ = 0;
    bytes_sent_ = 0;

    if (options_.chunk_size == 0) {
        return Fail(Status(StatusCode::kInvalidArgument,
                           "Chunk size must be non-zero"));
    }
    if (!channel_->IsConnected()) {
        return Fail(Status(StatusCode::kNotConnected,
                           "Printer is not connected"));
    }

    state_ = SessionState::kSending;

    std::span<const uint8_t> data = frame.data();
    std::vector<TransportChunk> chunks = PartitionFrame(data.size(),
                                                        options_.chunk_size);
    DB_PRINT("%s: sending %zu bytes in %zu chunks\n", __func__, data.size(),
             chunks.size());

    for (size_t i = 0; i < chunks.size(); i++) {
        const std::string where = "Chunk " + std::to_string(i + 1) + "/" +
                                  std::to_string(chunks.size()) + ": ";

        if (i > 0 && options_.chunk_delay.count() > 0) {
            std::this_thread::sleep_for(options_.chunk_delay);
        }

        /* Abort at the chunk boundary if the link went away. */
        if (!channel_->IsConnected()) {
            return Fail(Status(StatusCode::kDisconnected,
                               where + "printer disconnected"));
        }

        Status status = channel_->Write(
                data.subspan(chunks[i].offset, chunks[i].length),
                options_.write_timeout);
        if (!status.Ok()) {
            if (status.status() == StatusCode::kDisconnected ||
                !channel_->IsConnected()) {
                return Fail(Status(StatusCode::kDisconnected,
                                   where + status.message()));
            }
            return Fail(Status(StatusCode::kTransportError,
                               where + status.message()));
        }

        chunks_sent_++;
        bytes_sent_ += chunks[i].length;
    }

    state_ = SessionState::kComplete;
    return Status(StatusCode::kStatusOk);
}

};
