#ifndef STATUS_H
#define STATUS_H

#include <expected>
#include <string_view>
#include <string>


namespace booth_printer {

#define RETURN_IF_ERROR(expr)   \
    {                           \
        auto __result = (expr); \
        if (!__result.Ok()) {   \
            return __result;    \
        }                       \
    }

/* Same as RETURN_IF_ERROR, for functions returning std::expected<T, Status>. */
#define RETURN_UNEXPECTED_IF_ERROR(expr)           \
    {                                              \
        auto __result = (expr);                    \
        if (!__result.Ok()) {                      \
            return std::unexpected(__result);      \
        }                                          \
    }

enum class StatusCode {
    kStatusOk = 0x00,
    kInternalError = 0x01,
    kInvalidArgument = 0x02,
    kTimeout = 0x03,
    kNotFoundError = 0x04,
    /* Zero-sized or malformed source raster. */
    kInvalidImage = 0x05,
    /* The image does not fit the 16-bit raster header fields. */
    kFrameTooLarge = 0x06,
    kNotConnected = 0x07,
    /* The channel went away in the middle of a job. */
    kDisconnected = 0x08,
    /* Another job is still being sent on the channel. */
    kBusy = 0x09,
    kTransportError = 0x0a,
};

class Status {
  public:
    Status(StatusCode status, std::string_view msg,
           std::string_view user_friendly_msg) :
        status_(status),
        msg_(msg),
        user_friendly_msg_(user_friendly_msg) {}
    Status(StatusCode status, std::string_view msg) :
        Status(status, msg, DefaultUserFriendlyMessage(status)) {}
    Status(StatusCode status) :
        Status(status, /*msg=*/"") {}

    void prepend_message(std::string_view str);
    // Prints the message with status code stringified.
    void print_status();

    bool Ok() { return status_ == StatusCode::kStatusOk; }
    StatusCode status() { return status_; }
    std::string user_friendly_message() { return user_friendly_msg_; }
    std::string message() { return msg_; }

  private:
    static std::string status_code_stringify(StatusCode status);
    static std::string_view DefaultUserFriendlyMessage(StatusCode status);

    StatusCode status_;
    std::string msg_;
    std::string user_friendly_msg_;
};

};

#endif
