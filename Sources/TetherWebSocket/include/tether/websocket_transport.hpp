#pragma once

#include "tether/network.hpp"
#include <functional>
#include <memory>
#include <string>

namespace tether {

// ============================================================================
// websocket_transport - sync_transport over websocketpp (plain ws://)
// ============================================================================
//
// Runs its own io thread. Callbacks arrive on that thread; the change stream
// re-dispatches them onto the configured scheduler.

class websocket_transport : public sync_transport {
public:
    websocket_transport();
    ~websocket_transport() override;

    websocket_transport(const websocket_transport&) = delete;
    websocket_transport& operator=(const websocket_transport&) = delete;

    void connect(const std::string& url, const HeadersMap& headers = {}) override;
    void disconnect() override;
    transport_state state() const override;

    void send(const transport_message& message) override;

    void set_on_open(on_open_handler handler) override;
    void set_on_message(on_message_handler handler) override;
    void set_on_error(on_error_handler handler) override;
    void set_on_close(on_close_handler handler) override;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

// WebSocket push channel plus a platform-supplied HTTP client
class websocket_network_factory : public network_factory {
public:
    using http_client_maker = std::function<std::unique_ptr<http_client>()>;

    explicit websocket_network_factory(http_client_maker make_http = nullptr)
        : make_http_(std::move(make_http)) {}

    std::unique_ptr<http_client> create_http_client() override {
        if (make_http_) {
            if (auto client = make_http_()) return client;
        }
        return std::make_unique<null_http_client>();
    }

    std::unique_ptr<sync_transport> create_sync_transport() override {
        return std::make_unique<websocket_transport>();
    }

private:
    http_client_maker make_http_;
};

} // namespace tether
