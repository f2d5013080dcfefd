#include "tether/errors.hpp"

namespace tether {

const char* to_string(failure_kind kind) {
    switch (kind) {
        case failure_kind::none: return "none";
        case failure_kind::network: return "network";
        case failure_kind::timeout: return "timeout";
        case failure_kind::auth_mismatch: return "auth_mismatch";
        case failure_kind::server_rejected: return "server_rejected";
    }
    return "none";
}

failure_kind failure_kind_from_string(const std::string& s) {
    if (s == "network") return failure_kind::network;
    if (s == "timeout") return failure_kind::timeout;
    if (s == "auth_mismatch") return failure_kind::auth_mismatch;
    if (s == "server_rejected") return failure_kind::server_rejected;
    return failure_kind::none;
}

} // namespace tether
