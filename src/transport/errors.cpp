#include "errors.hpp"
#include <fmt/format.h>

const char* transport_error_name(TransportError error) {
    switch (error) {
        case TransportError::NONE:             return "none";
        case TransportError::TIMEOUT:          return "timeout";
        case TransportError::BROKEN_PIPE:      return "broken pipe";
        case TransportError::CONNECTION_RESET: return "connection reset";
        case TransportError::INVALID_CHECKSUM: return "invalid checksum";
        case TransportError::INVALID_COMMAND:  return "invalid command";
        case TransportError::INVALID_RESPONSE: return "invalid response";
        case TransportError::MALFORMED_STATE:  return "malformed state";
        case TransportError::RPC_FAILURE:      return "rpc failure";
        case TransportError::UNREACHABLE:      return "unreachable";
        case TransportError::AUTH_FAILED:      return "authentication failed";
    }
    return "unknown";
}

const char* backend_name(Backend backend) {
    switch (backend) {
        case Backend::DIRECT: return "direct";
        case Backend::PROXY:  return "proxy";
    }
    return "unknown";
}

bool is_recoverable(Backend backend, TransportError error) {
    switch (backend) {
        case Backend::DIRECT:
            switch (error) {
                case TransportError::MALFORMED_STATE:
                case TransportError::BROKEN_PIPE:
                case TransportError::INVALID_CHECKSUM:
                case TransportError::INVALID_COMMAND:
                case TransportError::INVALID_RESPONSE:
                case TransportError::TIMEOUT:
                    return true;
                default:
                    return false;
            }
        case Backend::PROXY:
            switch (error) {
                case TransportError::CONNECTION_RESET:
                case TransportError::RPC_FAILURE:
                    return true;
                default:
                    return false;
            }
    }
    return false;
}

TransportFault::TransportFault(Backend backend, TransportError error, const std::string& detail)
    : std::logic_error(fmt::format("unexpected {} error from the {} backend: {}",
                                   transport_error_name(error), backend_name(backend), detail)),
      backend_(backend), error_(error) {
}
