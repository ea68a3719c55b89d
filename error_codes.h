// *****************************************************************************
// Sync Error Codes
// *****************************************************************************

#ifndef _ERROR_CODES_H_
#define _ERROR_CODES_H_

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <string>

// Section 2: Definitions
/**
 * Status codes returned by every fallible engine operation.
 * 0 is success, every failure is negative.
 */
enum SyncErrorCode : std::int8_t {
    SYNC_OK = 0,
    SYNC_ERR_CONFIGURATION = -1,    ///< missing endpoint/credentials, invalid setting
    SYNC_ERR_NETWORK = -2,          ///< timeout, refused, certificate untrusted, bad status
    SYNC_ERR_AUTH = -3,             ///< invalid or expired credential
    SYNC_ERR_SNAPSHOT_BLOCKED = -4, ///< dataset still has open handles
    SYNC_ERR_BUSY = -5,             ///< a sync pass is already running
    SYNC_ERR_NOT_FOUND = -6,
    SYNC_ERR_IO = -7,
    SYNC_ERR_PROTOCOL = -8,         ///< malformed response or frame
    SYNC_ERR_INVALID_ARGUMENT = -9,
    SYNC_ERR_ALREADY_EXISTS = -10,
    SYNC_ERR_INVALID_STATE = -11,
};

/**
 * Error code plus the message that goes into the log buffer and the status.
 */
struct SyncError {
    int code = SYNC_OK;
    std::string message;

    [[nodiscard]] bool ok() const { return code == SYNC_OK; }

    static SyncError success() { return {}; }
    static SyncError make(int code, std::string message) { return {code, std::move(message)}; }
};

inline const char *syncErrorName(int code)
{
    switch (code) {
        case SYNC_OK: return "OK";
        case SYNC_ERR_CONFIGURATION: return "ConfigurationError";
        case SYNC_ERR_NETWORK: return "NetworkError";
        case SYNC_ERR_AUTH: return "AuthError";
        case SYNC_ERR_SNAPSHOT_BLOCKED: return "SnapshotBlocked";
        case SYNC_ERR_BUSY: return "Busy";
        case SYNC_ERR_NOT_FOUND: return "NotFound";
        case SYNC_ERR_IO: return "IOError";
        case SYNC_ERR_PROTOCOL: return "ProtocolError";
        case SYNC_ERR_INVALID_ARGUMENT: return "InvalidArgument";
        case SYNC_ERR_ALREADY_EXISTS: return "AlreadyExists";
        case SYNC_ERR_INVALID_STATE: return "InvalidState";
        default: return "Unknown";
    }
}

#endif // _ERROR_CODES_H_
