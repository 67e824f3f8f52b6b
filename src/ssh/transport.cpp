#include "transport.hpp"

const char* connect_failure_name(ConnectFailure failure) {
    switch (failure) {
    case ConnectFailure::NONE:    return "none";
    case ConnectFailure::AUTH:    return "authentication";
    case ConnectFailure::NETWORK: return "network";
    case ConnectFailure::TIMEOUT: return "timeout";
    }
    return "unknown";
}
