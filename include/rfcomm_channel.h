#ifndef RFCOMM_CHANNEL_H
#define RFCOMM_CHANNEL_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unistd.h>

#include "printer_channel.h"
#include "status.h"

namespace booth_printer {

/*
 * Printer reached through a device node, usually an rfcomm TTY bound to the
 * printer's serial port profile (rfcomm bind 0 <addr>), but any character
 * device that takes raw bytes works.
 */
class RfcommChannel : public PrinterChannel {
  public:
    static std::expected<std::unique_ptr<RfcommChannel>, Status>
       Create(const std::string &path);

    RfcommChannel(int fd, std::string_view path) : fd_(fd), path_(path) {}
    ~RfcommChannel() { close(fd_); }

    RfcommChannel(const RfcommChannel &) = delete;
    RfcommChannel &operator=(const RfcommChannel &) = delete;

    bool IsConnected() override;
    Status Write(std::span<const uint8_t> data,
                 std::chrono::milliseconds timeout) override;

  private:
    /*
     * Upper bound for a single write() call. The kernel buffers for the
     * rfcomm TTY are small anyway.
     */
    static constexpr size_t kMaxWriteSize = 0x10000;

    static Status MakeRaw(int fd);
    Status WaitWritable(std::chrono::steady_clock::time_point deadline);

    int fd_;
    const std::string path_;
    bool disconnected_ = false;
};

};

#endif
