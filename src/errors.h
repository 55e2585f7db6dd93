#pragma once

#include <string>

namespace xtrans {

/**
 * Failure causes reported by codec, transport and manager operations.
 */
enum class XtransErrorCode {
    NONE = 0,
    DECODE_ERROR,           // Malformed or unrecognised signaling code
    INVALID_FILE_ID,        // File id does not fit the 36-byte frame field
    CHANNEL_NOT_READY,      // Send attempted while the channel is not connected
    ACCEPT_TIMEOUT,         // Receiver never answered the file offer
    REJECTED,               // Receiver rejected (or cancelled) the transfer
    TRANSFER_TIMEOUT,       // Receive session did not finish in time
    NOT_FOUND,              // No transport/state registered for the device id
    CONNECT_ALL_FAILED,     // Preferred and all fallback transport kinds failed
    CLOSED,                 // Transport closed while the operation was waiting
    INVALID_ARGUMENT        // Caller input could not be used
};

const char* error_code_to_string(XtransErrorCode code);

/**
 * Error information filled into the optional out-parameter of fallible operations.
 */
struct XtransError {
    XtransErrorCode code;
    std::string message;

    XtransError() : code(XtransErrorCode::NONE) {}
    XtransError(XtransErrorCode error_code, const std::string& msg)
        : code(error_code), message(msg) {}

    bool ok() const { return code == XtransErrorCode::NONE; }
    std::string to_string() const;
};

/**
 * Store an error into an optional out-parameter.
 */
inline void set_error(XtransError* error, XtransErrorCode code, const std::string& message) {
    if (error) {
        error->code = code;
        error->message = message;
    }
}

} // namespace xtrans
