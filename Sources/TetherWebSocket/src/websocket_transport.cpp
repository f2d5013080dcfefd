#include "tether/websocket_transport.hpp"
#include "tether/log.hpp"

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include <atomic>
#include <mutex>
#include <thread>

namespace tether {

struct websocket_transport::impl {
    using client_t = websocketpp::client<websocketpp::config::asio_client>;
    using message_ptr = websocketpp::config::asio_client::message_type::ptr;

    client_t client;
    std::thread io_thread;
    std::atomic<transport_state> state{transport_state::closed};

    // Guards the handlers and the current connection handle
    std::mutex handler_mutex;
    websocketpp::connection_hdl hdl;
    on_open_handler on_open;
    on_message_handler on_message;
    on_error_handler on_error;
    on_close_handler on_close;

    impl() {
        client.clear_access_channels(websocketpp::log::alevel::all);
        client.clear_error_channels(websocketpp::log::elevel::all);
        client.init_asio();
        // Keep the io loop alive across reconnects
        client.start_perpetual();

        client.set_open_handler([this](websocketpp::connection_hdl h) {
            {
                std::lock_guard<std::mutex> lock(handler_mutex);
                hdl = h;
            }
            state = transport_state::open;
            if (auto fn = handler(on_open)) fn();
        });

        client.set_message_handler([this](websocketpp::connection_hdl, message_ptr msg) {
            if (auto fn = handler(on_message)) fn(transport_message::from_string(msg->get_payload()));
        });

        client.set_fail_handler([this](websocketpp::connection_hdl h) {
            state = transport_state::closed;
            std::string reason = "Connection failed";
            websocketpp::lib::error_code ec;
            auto con = client.get_con_from_hdl(h, ec);
            if (!ec && con) reason = con->get_ec().message();
            if (auto fn = handler(on_error)) fn(reason);
        });

        client.set_close_handler([this](websocketpp::connection_hdl h) {
            state = transport_state::closed;
            int code = websocketpp::close::status::normal;
            std::string reason = "Connection closed";
            websocketpp::lib::error_code ec;
            auto con = client.get_con_from_hdl(h, ec);
            if (!ec && con) {
                code = con->get_remote_close_code();
                reason = con->get_remote_close_reason();
            }
            if (auto fn = handler(on_close)) fn(code, reason);
        });

        io_thread = std::thread([this] { client.run(); });
    }

    ~impl() {
        client.stop_perpetual();
        close_connection();
        client.stop();
        if (io_thread.joinable()) {
            io_thread.join();
        }
    }

    websocketpp::connection_hdl current_hdl() {
        std::lock_guard<std::mutex> lock(handler_mutex);
        return hdl;
    }

    template <typename Fn>
    Fn handler(const Fn& fn) {
        std::lock_guard<std::mutex> lock(handler_mutex);
        return fn;
    }

    void close_connection() {
        if (state == transport_state::open) {
            state = transport_state::closing;
            websocketpp::lib::error_code ec;
            client.close(current_hdl(), websocketpp::close::status::normal, "Client disconnect", ec);
            if (ec) {
                LOG_WARN("websocket", "Close failed: %s", ec.message().c_str());
            }
        }
    }
};

websocket_transport::websocket_transport() : impl_(std::make_unique<impl>()) {}

websocket_transport::~websocket_transport() = default;

void websocket_transport::connect(const std::string& url, const HeadersMap& headers) {
    websocketpp::lib::error_code ec;
    auto con = impl_->client.get_connection(url, ec);
    if (ec) {
        LOG_ERROR("websocket", "Cannot connect to %s: %s", url.c_str(), ec.message().c_str());
        if (auto fn = impl_->handler(impl_->on_error)) fn(ec.message());
        return;
    }

    for (const auto& [key, value] : headers) {
        con->append_header(key, value);
    }

    impl_->state = transport_state::connecting;
    impl_->client.connect(con);
}

void websocket_transport::disconnect() {
    impl_->close_connection();
}

transport_state websocket_transport::state() const {
    return impl_->state;
}

void websocket_transport::send(const transport_message& message) {
    if (impl_->state != transport_state::open) return;

    auto hdl = impl_->current_hdl();
    websocketpp::lib::error_code ec;
    if (message.msg_type == transport_message::type::binary) {
        impl_->client.send(hdl, message.data.data(), message.data.size(),
                           websocketpp::frame::opcode::binary, ec);
    } else {
        impl_->client.send(hdl, message.as_string(), websocketpp::frame::opcode::text, ec);
    }
    if (ec) {
        LOG_WARN("websocket", "Send failed: %s", ec.message().c_str());
    }
}

void websocket_transport::set_on_open(on_open_handler handler) {
    std::lock_guard<std::mutex> lock(impl_->handler_mutex);
    impl_->on_open = std::move(handler);
}

void websocket_transport::set_on_message(on_message_handler handler) {
    std::lock_guard<std::mutex> lock(impl_->handler_mutex);
    impl_->on_message = std::move(handler);
}

void websocket_transport::set_on_error(on_error_handler handler) {
    std::lock_guard<std::mutex> lock(impl_->handler_mutex);
    impl_->on_error = std::move(handler);
}

void websocket_transport::set_on_close(on_close_handler handler) {
    std::lock_guard<std::mutex> lock(impl_->handler_mutex);
    impl_->on_close = std::move(handler);
}

} // namespace tether
