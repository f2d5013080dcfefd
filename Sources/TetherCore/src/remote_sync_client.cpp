#include "tether/remote_sync_client.hpp"
#include "tether/log.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>

namespace tether {

using json = nlohmann::json;

namespace {

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

// ============================================================================
// change_event
// ============================================================================

const char* to_string(change_event::type t) {
    switch (t) {
        case change_event::type::insert: return "insert";
        case change_event::type::update: return "update";
        case change_event::type::remove: return "delete";
    }
    return "update";
}

std::string change_event::to_json() const {
    json j;
    j["type"] = "change";
    j["event"] = to_string(event_type);
    j["row"] = json::parse(row.to_json());
    return j.dump();
}

std::optional<change_event> change_event::from_json(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        LOG_WARN("remote_client", "Unparseable realtime message: %s", e.what());
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;
    if (j.contains("type") && j["type"].is_string() && j["type"].get<std::string>() != "change") {
        return std::nullopt;
    }
    if (!j.contains("event") || !j["event"].is_string() || !j.contains("row") || !j["row"].is_object()) {
        return std::nullopt;
    }

    change_event event;
    auto name = j["event"].get<std::string>();
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "insert") {
        event.event_type = type::insert;
    } else if (name == "update") {
        event.event_type = type::update;
    } else if (name == "delete") {
        event.event_type = type::remove;
    } else {
        return std::nullopt;
    }

    auto row = record::from_json(j["row"].dump());
    if (!row) return std::nullopt;
    event.row = *row;
    return event;
}

// ============================================================================
// change_stream
// ============================================================================

struct change_stream::state : std::enable_shared_from_this<change_stream::state> {
    std::shared_ptr<timer_service> timers;
    SharedScheduler sched;
    std::unique_ptr<sync_transport> transport;
    std::string url;
    HeadersMap headers;
    std::string subscribe_message;
    std::string owner_id;
    remote_sync_client::change_handler on_change;
    int max_reconnect_attempts;
    std::chrono::milliseconds base_delay;

    mutable std::mutex mutex;
    bool closed = false;
    bool connected = false;
    bool reconnect_pending = false;
    bool gave_up = false;
    int attempts = 0;
    uint64_t round = 0;   // bumped by resume(); older reconnect timers are ignored
    timer_service::timer_id reconnect_timer = 0;

    state(std::shared_ptr<timer_service> t, SharedScheduler s) : timers(std::move(t)), sched(std::move(s)) {}

    void start() {
        std::weak_ptr<state> weak = shared_from_this();
        transport->set_on_open([weak] {
            if (auto self = weak.lock()) self->handle_open();
        });
        transport->set_on_message([weak](const transport_message& msg) {
            if (auto self = weak.lock()) self->handle_message(msg);
        });
        transport->set_on_error([weak](const std::string& error) {
            if (auto self = weak.lock()) self->handle_drop("error: " + error);
        });
        transport->set_on_close([weak](int code, const std::string& reason) {
            if (auto self = weak.lock()) {
                self->handle_drop("closed (" + std::to_string(code) + ") " + reason);
            }
        });
        transport->connect(url, headers);
    }

    void handle_open() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) return;
            connected = true;
            gave_up = false;
            attempts = 0;
        }
        LOG_INFO("remote_client", "Change stream open for %s", owner_id.c_str());
        transport->send(transport_message::from_string(subscribe_message));
    }

    void handle_message(const transport_message& msg) {
        auto event = change_event::from_json(msg.as_string());
        if (!event) {
            LOG_DEBUG("remote_client", "Ignoring realtime message: %s", msg.as_string().c_str());
            return;
        }
        std::weak_ptr<state> weak = shared_from_this();
        sched->invoke([weak, event = *event] {
            auto self = weak.lock();
            if (!self) return;
            {
                std::lock_guard<std::mutex> lock(self->mutex);
                if (self->closed) return;
            }
            self->on_change(event);
        });
    }

    void handle_drop(const std::string& why) {
        std::chrono::milliseconds delay{0};
        uint64_t current_round;
        {
            std::lock_guard<std::mutex> lock(mutex);
            connected = false;
            if (closed || reconnect_pending || gave_up) return;
            if (attempts >= max_reconnect_attempts) {
                gave_up = true;
                LOG_ERROR("remote_client", "Change stream for %s gave up after %d attempts (%s)",
                          owner_id.c_str(), attempts, why.c_str());
                return;
            }
            delay = base_delay * (int64_t{1} << std::min(attempts, 30));
            ++attempts;
            reconnect_pending = true;
            current_round = round;
        }
        LOG_WARN("remote_client", "Change stream %s; reconnecting in %lld ms",
                 why.c_str(), static_cast<long long>(delay.count()));

        std::weak_ptr<state> weak = shared_from_this();
        auto id = timers->schedule_after(delay, [weak, current_round] {
            auto self = weak.lock();
            if (!self) return;
            self->sched->invoke([weak, current_round] {
                auto inner = weak.lock();
                if (!inner) return;
                {
                    std::lock_guard<std::mutex> lock(inner->mutex);
                    if (inner->closed || inner->round != current_round) return;
                    inner->reconnect_pending = false;
                }
                inner->transport->connect(inner->url, inner->headers);
            });
        });
        std::lock_guard<std::mutex> lock(mutex);
        if (round == current_round) reconnect_timer = id;
    }

    void resume() {
        timer_service::timer_id pending_timer = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed || connected) return;
            if (!gave_up && !reconnect_pending) return;
            if (reconnect_pending) pending_timer = reconnect_timer;
            reconnect_pending = false;
            reconnect_timer = 0;
            gave_up = false;
            attempts = 0;
            ++round;
        }
        if (pending_timer != 0) timers->cancel(pending_timer);
        LOG_INFO("remote_client", "Resuming change stream for %s", owner_id.c_str());
        transport->connect(url, headers);
    }

    void close() {
        timer_service::timer_id pending_timer = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) return;
            closed = true;
            connected = false;
            if (reconnect_pending) pending_timer = reconnect_timer;
        }
        if (pending_timer != 0) timers->cancel(pending_timer);
        transport->disconnect();
        LOG_INFO("remote_client", "Change stream closed for %s", owner_id.c_str());
    }
};

change_stream::~change_stream() {
    close();
}

void change_stream::close() {
    if (state_) state_->close();
}

void change_stream::resume() {
    if (state_) state_->resume();
}

bool change_stream::gave_up() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->gave_up;
}

bool change_stream::is_connected() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->connected;
}

const std::string& change_stream::owner_id() const {
    return state_->owner_id;
}

int change_stream::reconnect_attempts() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->attempts;
}

// ============================================================================
// remote_sync_client
// ============================================================================

remote_sync_client::remote_sync_client(const configuration& config,
                                       std::shared_ptr<network_factory> factory,
                                       std::shared_ptr<user_context> users,
                                       std::shared_ptr<timer_service> timers,
                                       SharedScheduler sched)
    : config_(config)
    , factory_(factory ? std::move(factory) : std::make_shared<null_network_factory>())
    , users_(std::move(users))
    , timers_(std::move(timers))
    , scheduler_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>())
{
    http_ = factory_->create_http_client();
    if (!http_) {
        http_ = std::make_unique<null_http_client>();
    }
}

failure_kind remote_sync_client::classify_status(int status_code) {
    if (status_code >= 200 && status_code < 300) return failure_kind::none;
    if (status_code == 408 || status_code == 504) return failure_kind::timeout;
    if (status_code == 401 || status_code == 403) return failure_kind::auth_mismatch;
    if (status_code == 0 || status_code == 429 || status_code >= 500) return failure_kind::network;
    return failure_kind::server_rejected;
}

HeadersMap remote_sync_client::auth_headers() const {
    HeadersMap headers;
    if (!config_.api_key.empty()) {
        headers["apikey"] = config_.api_key;
    }
    if (!config_.authorization_token.empty()) {
        headers["Authorization"] = "Bearer " + config_.authorization_token;
    }
    return headers;
}

std::string remote_sync_client::table_url() const {
    return strip_trailing_slash(config_.rest_url) + "/" + config_.table_name;
}

http_request remote_sync_client::build_request(const sync_operation& op, const std::string& owner_id) const {
    http_request req;
    req.headers = auth_headers();
    std::string base = table_url();

    switch (op.kind) {
        case operation_kind::create: {
            record row = op.payload;
            row.owner_id = owner_id;
            req.method = "POST";
            req.url = base;
            req.headers["Prefer"] = "return=minimal";
            req.set_json_body(row.to_json());
            break;
        }
        case operation_kind::update: {
            record row = op.payload;
            row.owner_id = owner_id;
            req.method = "POST";
            req.url = base + "?on_conflict=id";
            req.headers["Prefer"] = "resolution=merge-duplicates,return=minimal";
            req.set_json_body(row.to_json());
            break;
        }
        case operation_kind::remove:
            req.method = "DELETE";
            req.url = base + "?id=eq." + url_encode(op.record_id) + "&owner_id=eq." + url_encode(owner_id);
            break;
    }
    return req;
}

http_request remote_sync_client::build_fetch_request(const std::string& owner_id) const {
    http_request req;
    req.method = "GET";
    req.headers = auth_headers();
    req.headers["Accept"] = "application/json";
    req.url = table_url() + "?select=*&owner_id=eq." + url_encode(owner_id) + "&order=created_at.asc";
    return req;
}

void remote_sync_client::push(const sync_operation& op, push_completion completion) {
    auto owner = users_->current_owner();
    if (!owner || op.payload.owner_id != *owner) {
        std::string why = owner ? "operation owner " + op.payload.owner_id + " is not the session owner"
                                : std::string("no authenticated session");
        LOG_WARN("remote_client", "Refusing %s %s: %s", to_string(op.kind), op.id.c_str(), why.c_str());
        scheduler_->invoke([completion, why] {
            completion(push_result::failed(failure_kind::auth_mismatch, why));
        });
        return;
    }

    auto req = build_request(op, *owner);
    LOG_DEBUG("remote_client", "%s %s", req.method.c_str(), req.url.c_str());

    auto sched = scheduler_;
    std::string op_id = op.id;
    http_->send_async(req, [sched, completion, op_id](http_response resp) {
        push_result result;
        failure_kind kind = classify_status(resp.status_code);
        if (kind == failure_kind::none) {
            result = push_result::ok();
        } else {
            std::string why = resp.status_code == 0 ? std::string("no response")
                                                    : "HTTP " + std::to_string(resp.status_code);
            auto body = resp.body_string();
            if (!body.empty()) why += ": " + body.substr(0, 200);
            LOG_INFO("remote_client", "Push %s failed (%s): %s", op_id.c_str(), to_string(kind), why.c_str());
            result = push_result::failed(kind, why);
        }
        sched->invoke([completion, result] { completion(result); });
    });
}

void remote_sync_client::fetch_rows(const std::string& owner_id, fetch_completion completion) {
    auto owner = users_->current_owner();
    if (!owner || *owner != owner_id) {
        std::string why = owner ? owner_id + " is not the session owner" : std::string("no authenticated session");
        LOG_WARN("remote_client", "Refusing fetch: %s", why.c_str());
        scheduler_->invoke([completion, why] {
            fetch_result result;
            result.failure = failure_kind::auth_mismatch;
            result.reason = why;
            completion(result);
        });
        return;
    }

    auto req = build_fetch_request(owner_id);
    LOG_DEBUG("remote_client", "%s %s", req.method.c_str(), req.url.c_str());

    auto sched = scheduler_;
    http_->send_async(req, [sched, completion](http_response resp) {
        fetch_result result;
        failure_kind kind = classify_status(resp.status_code);
        if (kind != failure_kind::none) {
            result.failure = kind;
            result.reason = resp.status_code == 0 ? std::string("no response")
                                                  : "HTTP " + std::to_string(resp.status_code);
        } else {
            try {
                auto body = json::parse(resp.body_string());
                if (!body.is_array()) {
                    result.failure = failure_kind::server_rejected;
                    result.reason = "expected a JSON array of rows";
                } else {
                    result.success = true;
                    for (const auto& item : body) {
                        auto row = record::from_json(item.dump());
                        if (!row) {
                            LOG_WARN("remote_client", "Skipping malformed row: %s", item.dump().c_str());
                            continue;
                        }
                        result.rows.push_back(*row);
                    }
                }
            } catch (const json::parse_error& e) {
                result.failure = failure_kind::server_rejected;
                result.reason = std::string("unparseable rows: ") + e.what();
            }
        }
        if (!result.success) {
            LOG_INFO("remote_client", "Fetch failed (%s): %s", to_string(result.failure), result.reason.c_str());
        }
        sched->invoke([completion, result] { completion(result); });
    });
}

std::unique_ptr<change_stream> remote_sync_client::open_change_stream(const std::string& owner_id,
                                                                      change_handler on_change) {
    if (config_.realtime_url.empty()) {
        return nullptr;
    }
    auto transport = factory_->create_sync_transport();
    if (!transport) {
        LOG_WARN("remote_client", "No push transport available; realtime disabled");
        return nullptr;
    }

    auto s = std::make_shared<change_stream::state>(timers_, scheduler_);
    s->transport = std::move(transport);
    s->url = config_.realtime_url;
    s->headers = auth_headers();
    s->owner_id = owner_id;
    s->on_change = std::move(on_change);
    s->max_reconnect_attempts = config_.max_reconnect_attempts;
    s->base_delay = config_.base_reconnect_delay;

    json subscribe;
    subscribe["type"] = "subscribe";
    subscribe["table"] = config_.table_name;
    subscribe["filter"] = "owner_id=eq." + owner_id;
    s->subscribe_message = subscribe.dump();

    s->start();
    return std::make_unique<change_stream>(s);
}

} // namespace tether
