#include "errors.h"

namespace xtrans {

const char* error_code_to_string(XtransErrorCode code) {
    switch (code) {
        case XtransErrorCode::NONE: return "NONE";
        case XtransErrorCode::DECODE_ERROR: return "DECODE_ERROR";
        case XtransErrorCode::INVALID_FILE_ID: return "INVALID_FILE_ID";
        case XtransErrorCode::CHANNEL_NOT_READY: return "CHANNEL_NOT_READY";
        case XtransErrorCode::ACCEPT_TIMEOUT: return "ACCEPT_TIMEOUT";
        case XtransErrorCode::REJECTED: return "REJECTED";
        case XtransErrorCode::TRANSFER_TIMEOUT: return "TRANSFER_TIMEOUT";
        case XtransErrorCode::NOT_FOUND: return "NOT_FOUND";
        case XtransErrorCode::CONNECT_ALL_FAILED: return "CONNECT_ALL_FAILED";
        case XtransErrorCode::CLOSED: return "CLOSED";
        case XtransErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default: return "UNKNOWN";
    }
}

std::string XtransError::to_string() const {
    if (message.empty()) {
        return error_code_to_string(code);
    }
    return std::string(error_code_to_string(code)) + ": " + message;
}

} // namespace xtrans
