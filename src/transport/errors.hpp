#pragma once

#include <stdexcept>
#include <string>

// Failure kinds a transport or proxy client can report.
enum class TransportError {
    NONE,
    TIMEOUT,            // I/O deadline passed
    BROKEN_PIPE,        // peer went away mid-write/read
    CONNECTION_RESET,   // proxy connection reset
    INVALID_CHECKSUM,   // integrity check on a received packet failed
    INVALID_COMMAND,    // peer rejected or did not understand the request
    INVALID_RESPONSE,   // reply did not match the protocol
    MALFORMED_STATE,    // local protocol state no longer consistent
    RPC_FAILURE,        // proxy server returned an error
    UNREACHABLE,        // open(): resolve/connect failed
    AUTH_FAILED,        // open(): credentials rejected
};

// Which ConnectionManager variant is in use
enum class Backend {
    DIRECT,
    PROXY,
};

const char* transport_error_name(TransportError error);
const char* backend_name(Backend backend);

// The closed set of error kinds that mean "connection lost" for a backend.
// Anything else reaching a controller is a programming defect.
bool is_recoverable(Backend backend, TransportError error);

// Raised when an error kind outside the backend's recoverable set surfaces.
class TransportFault : public std::logic_error {
public:
    TransportFault(Backend backend, TransportError error, const std::string& detail);

    Backend backend() const { return backend_; }
    TransportError error() const { return error_; }

private:
    Backend backend_;
    TransportError error_;
};
