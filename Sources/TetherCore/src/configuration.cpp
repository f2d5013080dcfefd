#include "tether/configuration.hpp"
#include "tether/errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace tether {

using json = nlohmann::json;

namespace {

void read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        throw config_error(std::string("\"") + key + "\" must be a string");
    }
    out = j[key].get<std::string>();
}

int64_t read_non_negative(const json& j, const char* key) {
    if (!j[key].is_number_integer() || j[key].get<int64_t>() < 0) {
        throw config_error(std::string("\"") + key + "\" must be a non-negative integer");
    }
    return j[key].get<int64_t>();
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) return;
    out = std::chrono::milliseconds(read_non_negative(j, key));
}

void read_bool(const json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_boolean()) {
        throw config_error(std::string("\"") + key + "\" must be a boolean");
    }
    out = j[key].get<bool>();
}

} // namespace

configuration configuration::from_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("Malformed configuration: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    configuration config;
    read_string(j, "storagePath", config.storage_path);
    read_string(j, "restUrl", config.rest_url);
    read_string(j, "realtimeUrl", config.realtime_url);
    read_string(j, "apiKey", config.api_key);
    read_string(j, "authorizationToken", config.authorization_token);
    read_string(j, "tableName", config.table_name);
    if (config.table_name.empty()) {
        throw config_error("\"tableName\" must not be empty");
    }

    if (j.contains("maxNameLength")) {
        config.max_name_length = static_cast<size_t>(read_non_negative(j, "maxNameLength"));
        if (config.max_name_length == 0) {
            throw config_error("\"maxNameLength\" must be positive");
        }
    }
    read_millis(j, "retryIntervalMs", config.retry_interval);
    if (config.retry_interval.count() == 0) {
        throw config_error("\"retryIntervalMs\" must be positive");
    }
    read_millis(j, "baseBackoffMs", config.base_backoff);
    read_millis(j, "maxBackoffMs", config.max_backoff);
    read_millis(j, "baseReconnectDelayMs", config.base_reconnect_delay);
    if (j.contains("maxReconnectAttempts")) {
        config.max_reconnect_attempts = static_cast<int>(read_non_negative(j, "maxReconnectAttempts"));
    }
    read_bool(j, "pullOnSession", config.pull_on_session);

    if (j.contains("logLevel")) {
        std::string name;
        read_string(j, "logLevel", name);
        if (!parse_log_level(name, config.log_threshold)) {
            throw config_error("Unknown logLevel \"" + name + "\"");
        }
    }
    return config;
}

configuration load_configuration(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("Cannot open configuration file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return configuration::from_json(buffer.str());
}

} // namespace tether
