#pragma once

#include <stdexcept>
#include <string>

namespace tether {

// Base for every exception the engine throws
class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Bad caller input: empty or over-long name, empty patch, empty owner.
class validation_error : public error {
public:
    explicit validation_error(const std::string& msg) : error(msg) {}
};

/// Unknown or tombstoned record id.
class not_found_error : public error {
public:
    explicit not_found_error(const std::string& msg) : error(msg) {}
};

/// Persistence substrate failure.
class db_error : public error {
public:
    explicit db_error(const std::string& msg) : error(msg) {}
};

class config_error : public error {
public:
    explicit config_error(const std::string& msg) : error(msg) {}
};

// ============================================================================
// Push failure taxonomy - recorded on queue entries, never thrown
// ============================================================================

enum class failure_kind : int {
    none = 0,
    network = 1,          // retryable
    timeout = 2,          // retryable
    auth_mismatch = 3,    // operation owner != session owner
    server_rejected = 4   // backend-side validation failure
};

inline bool is_retryable(failure_kind kind) noexcept {
    return kind == failure_kind::network || kind == failure_kind::timeout;
}

const char* to_string(failure_kind kind);
failure_kind failure_kind_from_string(const std::string& s);

} // namespace tether
