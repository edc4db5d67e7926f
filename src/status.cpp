#include "status.h"

#include <iostream>
#include <string>
#include <string_view>

namespace booth_printer {

void Status::prepend_message(std::string_view str)
{
    msg_.insert(0, str);
}

void Status::print_status()
{
    std::cout << status_code_stringify(status_) << " " << msg_ << std::endl;
    if (!user_friendly_msg_.empty()) {
        std::cout << "\t" << user_friendly_msg_ << std::endl;
    }
}

std::string Status::status_code_stringify(StatusCode status) {
    switch (status) {
    case StatusCode::kStatusOk:
        return "OK";
    case StatusCode::kInternalError:
        return "Internal error";
    case StatusCode::kInvalidArgument:
        return "Invalid argument";
    case StatusCode::kTimeout:
        return "Timeout";
    case StatusCode::kNotFoundError:
        return "Not found";
    case StatusCode::kInvalidImage:
        return "Invalid image";
    case StatusCode::kFrameTooLarge:
        return "Frame too large";
    case StatusCode::kNotConnected:
        return "Not connected";
    case StatusCode::kDisconnected:
        return "Disconnected";
    case StatusCode::kBusy:
        return "Busy";
    case StatusCode::kTransportError:
        return "Transport error";
    default:
        return "Unknown";
    }
}

/*
 * Connection problems are the only ones the person at the kiosk can fix
 * themselves, so they get a hint. Everything else is for the operator.
 */
std::string_view Status::DefaultUserFriendlyMessage(StatusCode status)
{
    switch (status) {
    case StatusCode::kNotConnected:
    case StatusCode::kDisconnected:
        return "Reconnect the printer and try again";
    case StatusCode::kBusy:
        return "The printer is still printing, please wait";
    case StatusCode::kFrameTooLarge:
        return "The picture is too long to print";
    default:
        return "";
    }
}

};
