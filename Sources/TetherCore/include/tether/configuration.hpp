#pragma once

#include "log.hpp"
#include "scheduler.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace tether {

struct configuration {
    /// Backing store. "" = nothing persisted; ":memory:" or a file path = SQLite.
    std::string storage_path;

    /// Backend REST root, e.g. "https://project.example.com/rest/v1".
    /// Empty string = pushes fail as network errors and stay queued.
    std::string rest_url;

    /// Realtime push channel URL. Empty string = no change stream.
    std::string realtime_url;

    /// Sent as the "apikey" header
    std::string api_key;

    /// Sent as "Authorization: Bearer <token>"
    std::string authorization_token;

    /// Remote row table
    std::string table_name = "records";

    /// Upper bound on the trimmed record name
    size_t max_name_length = 100;

    /// Period of the retry scheduler's recurring pass. Must be positive.
    std::chrono::milliseconds retry_interval{5000};

    /// Failed pushes wait min(base_backoff * 2^(attempts-1), max_backoff)
    std::chrono::milliseconds base_backoff{1000};
    std::chrono::milliseconds max_backoff{60000};

    /// Change stream reconnect: base_reconnect_delay * 2^attempt
    int max_reconnect_attempts = 6;
    std::chrono::milliseconds base_reconnect_delay{1000};

    /// Fetch the owner's rows from the backend when the repository opens with
    /// a session and whenever the session owner changes
    bool pull_on_session = true;

    /// Scheduler for completions and ticks. nullptr = immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;

    /// Applied to the global log level when the repository starts
    log_level log_threshold = log_level::warn;

    configuration() = default;

    explicit configuration(const std::string& storage) : storage_path(storage) {}

    configuration(const std::string& storage, std::shared_ptr<tether::scheduler> s)
        : storage_path(storage), sched(std::move(s)) {}

    /// Parse a JSON document with camelCase keys. Missing keys keep their
    /// defaults, unknown keys are ignored. Throws config_error on malformed
    /// JSON or a wrongly typed value.
    static configuration from_json(const std::string& text);
};

/// Read and parse a configuration file. Throws config_error.
configuration load_configuration(const std::string& path);

} // namespace tether
