#include "common/types.hpp"

auto describe(WireErrorCode code) noexcept -> std::string_view
{
    switch (code) {
        case WireErrorCode::kAddrParse:        return "wrong IPv4 address format";
        case WireErrorCode::kIo:               return "IO error occurred";
        case WireErrorCode::kUnexpectedPacket: return "received unexpected package";
        case WireErrorCode::kEncode:           return "could not encode/send package";
        case WireErrorCode::kDecode:           return "could not decode/receive package";
        case WireErrorCode::kAuth:             return "could not authenticate user";
        case WireErrorCode::kServer:           return "server reported an error";
    }
    return "unknown error";
}

auto to_string(const WireError& error) -> std::string
{
    if (error.code == WireErrorCode::kServer) {
        return error.message;
    }

    std::string text{describe(error.code)};
    if (!error.message.empty()) {
        text += ": ";
        text += error.message;
    }
    if (!error.context.empty()) {
        text += " (";
        text += error.context;
        text += ")";
    }
    return text;
}
