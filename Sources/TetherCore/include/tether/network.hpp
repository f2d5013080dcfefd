#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tether {

using HeadersMap = std::map<std::string, std::string>;

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Platform layers provide the implementation (URLSession, OkHttp, libcurl...).
// A status_code of 0 means no response was received.

struct http_response {
    int status_code = 0;
    HeadersMap headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    HeadersMap headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    // The handler may run on any thread
    using completion_handler = std::function<void(http_response)>;
    virtual void send_async(const http_request& request, completion_handler handler) = 0;
};

// ============================================================================
// Sync Transport Interface
// ============================================================================
//
// Bidirectional push channel (WebSocket or similar) carrying realtime change
// events.

enum class transport_state {
    connecting,
    open,
    closing,
    closed
};

struct transport_message {
    enum class type { text, binary };
    type msg_type = type::text;
    std::vector<uint8_t> data;

    std::string as_string() const {
        return std::string(data.begin(), data.end());
    }

    static transport_message from_string(const std::string& s) {
        transport_message msg;
        msg.msg_type = type::text;
        msg.data = std::vector<uint8_t>(s.begin(), s.end());
        return msg;
    }
};

class sync_transport {
public:
    virtual ~sync_transport() = default;

    // Connection lifecycle
    virtual void connect(const std::string& url, const HeadersMap& headers = {}) = 0;
    virtual void disconnect() = 0;
    virtual transport_state state() const = 0;

    virtual void send(const transport_message& message) = 0;

    // Event callbacks
    using on_open_handler = std::function<void()>;
    using on_message_handler = std::function<void(const transport_message&)>;
    using on_error_handler = std::function<void(const std::string& error)>;
    using on_close_handler = std::function<void(int code, const std::string& reason)>;

    virtual void set_on_open(on_open_handler handler) = 0;
    virtual void set_on_message(on_message_handler handler) = 0;
    virtual void set_on_error(on_error_handler handler) = 0;
    virtual void set_on_close(on_close_handler handler) = 0;
};

// ============================================================================
// Factory for platform-specific clients, chosen once at startup
// ============================================================================

class network_factory {
public:
    virtual ~network_factory() = default;

    virtual std::unique_ptr<http_client> create_http_client() = 0;

    // May return nullptr when the platform has no push channel
    virtual std::unique_ptr<sync_transport> create_sync_transport() = 0;
};

// ============================================================================
// Null implementations: local-only operation
// ============================================================================

class null_http_client : public http_client {
public:
    void send_async(const http_request&, completion_handler handler) override {
        if (handler) handler(http_response{0, {}, {}});
    }
};

class null_network_factory : public network_factory {
public:
    std::unique_ptr<http_client> create_http_client() override {
        return std::make_unique<null_http_client>();
    }

    std::unique_ptr<sync_transport> create_sync_transport() override {
        return nullptr;
    }
};

} // namespace tether
