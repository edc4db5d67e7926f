#include "rfcomm_channel.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>

#include "status.h"
#include "utils.h"

namespace booth_printer {

namespace {

/* errno values after which the link is gone for good. */
bool IsDisconnectErrno(int err)
{
    switch (err) {
    case EPIPE:
    case ECONNRESET:
    case ENOTCONN:
    case EIO:
    case ENODEV:
    case ENXIO:
    case EHOSTDOWN:
        return true;
    default:
        return false;
    }
}

};

std::expected<std::unique_ptr<RfcommChannel>, Status>
        RfcommChannel::Create(const std::string &path)
{
    int fd = open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        int err = errno;
        StatusCode code = err == ENOENT ? StatusCode::kNotFoundError :
                                          StatusCode::kNotConnected;
        return std::unexpected(Status(code, "Failed to open " + path + ": " +
                                      strerror(err)));
    }

    Status status = MakeRaw(fd);
    if (!status.Ok()) {
        close(fd);
        status.prepend_message(path + ": ");
        return std::unexpected(status);
    }

    return std::make_unique<RfcommChannel>(fd, path);
}

/*
 * A TTY in cooked mode rewrites 0x0a into "\r\n", which shifts every
 * following raster byte. Plain character devices are left alone.
 */
Status RfcommChannel::MakeRaw(int fd)
{
    if (!isatty(fd)) {
        return Status(StatusCode::kStatusOk);
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) < 0) {
        return Status(StatusCode::kInternalError,
                      std::string("tcgetattr failed: ") + strerror(errno));
    }
    cfmakeraw(&tio);
    if (tcsetattr(fd, TCSANOW, &tio) < 0) {
        return Status(StatusCode::kInternalError,
                      std::string("tcsetattr failed: ") + strerror(errno));
    }
    return Status(StatusCode::kStatusOk);
}

bool RfcommChannel::IsConnected()
{
    if (disconnected_) {
        return false;
    }

    struct pollfd pfd;
    memset(&pfd, 0, sizeof(pfd));
    pfd.fd = fd_;
    pfd.events = POLLOUT;

    int ret = poll(&pfd, 1, /*timeout=*/0);
    if (ret < 0) {
        DB_PRINT("%s: poll on %s failed, errno %d\n", __func__, path_.c_str(),
                 errno);
        return true;
    }
    if (ret > 0 && (pfd.revents & (POLLHUP | POLLERR | POLLNVAL))) {
        DB_PRINT("%s: %s hung up (revents %x)\n", __func__, path_.c_str(),
                 pfd.revents);
        disconnected_ = true;
    }
    return !disconnected_;
}

Status RfcommChannel::WaitWritable(
        std::chrono::steady_clock::time_point deadline)
{
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
                deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::microseconds(0);
        }

        /* set and timeout must be reset on each iteration. */
        fd_set set;
        FD_ZERO(&set);
        FD_SET(fd_, &set);
        struct timeval timeout;
        memset(&timeout, 0, sizeof(timeout));
        timeout.tv_sec = remaining.count() / 1000000;
        timeout.tv_usec = remaining.count() % 1000000;

        int ret = select(fd_ + 1, /*readfds=*/NULL, /*writefds=*/&set,
                         /*exceptfds=*/NULL, &timeout);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Status(StatusCode::kTransportError,
                          std::string("Failed to select on write: ") +
                          strerror(errno));
        } else if (ret == 0) {
            return Status(StatusCode::kTimeout, "Timed out on write");
        }
        return Status(StatusCode::kStatusOk);
    }
}

Status RfcommChannel::Write(std::span<const uint8_t> data,
                            std::chrono::milliseconds timeout)
{
    if (disconnected_) {
        return Status(StatusCode::kDisconnected, path_ + " is disconnected");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    size_t total_written = 0;
    while (total_written < data.size()) {
        RETURN_IF_ERROR(WaitWritable(deadline));

        size_t num_to_write = std::min(data.size() - total_written,
                                       kMaxWriteSize);
        ssize_t bytes_written = write(fd_, &data[total_written], num_to_write);
        if (bytes_written < 0) {
            int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    return Status(StatusCode::kTimeout, "Timed out on write");
                }
                continue;
            }
            if (IsDisconnectErrno(err)) {
                disconnected_ = true;
                return Status(StatusCode::kDisconnected,
                              path_ + ": " + strerror(err));
            }
            return Status(StatusCode::kTransportError,
                          "Failed to send data: " + std::string(strerror(err)));
        }

        DB_PRINT("%s: wrote %zd bytes\n", __func__, bytes_written);
        DB_PRINT_ARRAY(&data[total_written], static_cast<size_t>(bytes_written));

        total_written += bytes_written;
    }

    return Status(StatusCode::kStatusOk);
}

};
