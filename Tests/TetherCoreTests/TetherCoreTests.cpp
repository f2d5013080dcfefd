// Assertions are the test mechanism; keep them in release builds
#undef NDEBUG

#include <tether/tether.hpp>
#include <tether/backing_store.hpp>
#include <tether/record_store.hpp>
#include <tether/remote_sync_client.hpp>
#include <tether/sync_queue.hpp>
#include "FakeBackend.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

using namespace std::chrono_literals;
using tether_test::harness;

namespace {

tether::record_patch rename_to(const std::string& name) {
    tether::record_patch patch;
    patch.name = name;
    return patch;
}

tether::record make_record(const std::string& id, const std::string& name, const std::string& owner,
                           tether::timestamp_t at) {
    tether::record r;
    r.id = id;
    r.name = name;
    r.owner_id = owner;
    r.created_at = at;
    r.updated_at = at;
    return r;
}

std::string temp_db_path(const std::string& name) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
    return path;
}

template <typename Fn>
bool throws_validation(Fn&& fn) {
    try {
        fn();
    } catch (const tether::validation_error&) {
        return true;
    }
    return false;
}

template <typename Fn>
bool throws_not_found(Fn&& fn) {
    try {
        fn();
    } catch (const tether::not_found_error&) {
        return true;
    }
    return false;
}

template <typename Fn>
bool throws_db(Fn&& fn) {
    try {
        fn();
    } catch (const tether::db_error&) {
        return true;
    }
    return false;
}

// Backing store whose operation writes can be made to fail
struct failing_store : tether::null_backing_store {
    bool fail_operations = false;

    void save_operation(const tether::sync_operation&) override {
        if (fail_operations) throw tether::db_error("disk I/O error");
    }
};

template <typename Fn>
bool throws_config(Fn&& fn) {
    try {
        fn();
    } catch (const tether::config_error&) {
        return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Value types
// ============================================================================

void test_timestamps() {
    std::cout << "Testing timestamps..." << std::endl;

    assert(tether::format_timestamp(tether::from_millis(0)) == "1970-01-01T00:00:00.000Z");

    auto ts = tether::parse_timestamp("2025-09-13T10:29:14.123Z");
    assert(ts.has_value());
    assert(tether::format_timestamp(*ts) == "2025-09-13T10:29:14.123Z");

    // Offsets and extra precision normalise to the same instant
    assert(tether::parse_timestamp("2025-09-13T12:29:14.123+02:00") == ts);
    assert(tether::parse_timestamp("2025-09-13T10:29:14.123456+00:00") == ts);
    assert(tether::to_millis(*tether::parse_timestamp("2025-09-13T10:29:14Z")) == tether::to_millis(*ts) - 123);

    assert(!tether::parse_timestamp("yesterday").has_value());
    assert(!tether::parse_timestamp("2025-13-01T00:00:00Z").has_value());
    assert(!tether::parse_timestamp("2025-09-13T10:29:14.123Q").has_value());

    std::cout << "  Timestamp test passed!" << std::endl;
}

void test_ids_and_trim() {
    std::cout << "Testing ids and trim..." << std::endl;

    auto id = tether::generate_id();
    assert(id.size() == 36);
    assert(id[14] == '4');
    assert(id != tether::generate_id());

    auto parsed = tether::uuid_t::from_string(id);
    assert(parsed.has_value());
    assert(parsed->to_string() == id);
    assert(!tether::uuid_t::from_string("not-a-uuid").has_value());

    assert(tether::trim("  Push-ups \n") == "Push-ups");
    assert(tether::trim("   ").empty());

    assert(tether::utf8_length("") == 0);
    assert(tether::utf8_length("Push-ups") == 8);
    assert(tether::utf8_length("Crunches \xC3\xA9") == 10);          // e-acute
    assert(tether::utf8_length("\xE6\x8C\xBA\xE8\xBA\xAB") == 2);   // two CJK characters
    assert(tether::utf8_length("\xF0\x9F\x92\xAA") == 1);           // emoji

    std::cout << "  Id test passed!" << std::endl;
}

void test_record_json() {
    std::cout << "Testing record JSON..." << std::endl;

    auto at = *tether::parse_timestamp("2025-09-13T10:29:14.123Z");
    auto r = make_record(tether::generate_id(), "Squats", "U", at);
    r.updated_at = at + 250ms;

    auto decoded = tether::record::from_json(r.to_json());
    assert(decoded.has_value());
    assert(*decoded == r);

    // Backend rows may name the owner column user_id
    auto legacy = tether::record::from_json(
        R"({"id":"abc","name":"Lunges","user_id":"U","created_at":"2025-09-13T10:29:14.123Z","deleted":true})");
    assert(legacy.has_value());
    assert(legacy->owner_id == "U");
    assert(legacy->deleted);
    assert(legacy->updated_at == legacy->created_at);

    assert(!tether::record::from_json("not json").has_value());
    assert(!tether::record::from_json(R"({"name":"no id"})").has_value());

    std::cout << "  Record JSON test passed!" << std::endl;
}

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    auto config = tether::configuration::from_json(R"({
        "storagePath": "/tmp/tether.sqlite",
        "restUrl": "https://project.example.com/rest/v1",
        "realtimeUrl": "wss://project.example.com/realtime/v1",
        "apiKey": "anon",
        "authorizationToken": "jwt",
        "tableName": "exercises",
        "maxNameLength": 50,
        "retryIntervalMs": 2000,
        "baseBackoffMs": 500,
        "maxBackoffMs": 30000,
        "maxReconnectAttempts": 3,
        "baseReconnectDelayMs": 250,
        "logLevel": "debug",
        "pullOnSession": false,
        "somethingElse": [1, 2, 3]
    })");
    assert(config.storage_path == "/tmp/tether.sqlite");
    assert(config.rest_url == "https://project.example.com/rest/v1");
    assert(config.realtime_url == "wss://project.example.com/realtime/v1");
    assert(config.api_key == "anon");
    assert(config.authorization_token == "jwt");
    assert(config.table_name == "exercises");
    assert(config.max_name_length == 50);
    assert(config.retry_interval == 2000ms);
    assert(config.base_backoff == 500ms);
    assert(config.max_backoff == 30000ms);
    assert(config.max_reconnect_attempts == 3);
    assert(config.base_reconnect_delay == 250ms);
    assert(config.log_threshold == tether::log_level::debug);
    assert(!config.pull_on_session);

    auto defaults = tether::configuration::from_json("{}");
    assert(defaults.storage_path.empty());
    assert(defaults.table_name == "records");
    assert(defaults.max_name_length == 100);
    assert(defaults.retry_interval == 5000ms);
    assert(defaults.base_backoff == 1000ms);
    assert(defaults.max_backoff == 60000ms);
    assert(defaults.max_reconnect_attempts == 6);
    assert(defaults.log_threshold == tether::log_level::warn);
    assert(defaults.pull_on_session);

    assert(throws_config([] { tether::configuration::from_json("{"); }));
    assert(throws_config([] { tether::configuration::from_json("[]"); }));
    assert(throws_config([] { tether::configuration::from_json(R"({"restUrl": 5})"); }));
    assert(throws_config([] { tether::configuration::from_json(R"({"maxNameLength": "ten"})"); }));
    assert(throws_config([] { tether::configuration::from_json(R"({"retryIntervalMs": -1})"); }));
    assert(throws_config([] { tether::configuration::from_json(R"({"retryIntervalMs": 0})"); }));
    assert(tether::configuration::from_json(R"({"baseBackoffMs": 0})").base_backoff == 0ms);
    assert(throws_config([] { tether::configuration::from_json(R"({"pullOnSession": "yes"})"); }));
    assert(throws_config([] { tether::configuration::from_json(R"({"logLevel": "verbose"})"); }));
    assert(throws_config([] { tether::load_configuration("/nonexistent/tether.json"); }));

    auto path = (std::filesystem::temp_directory_path() / "tether_config_test.json").string();
    {
        std::ofstream out(path);
        out << R"({"restUrl": "https://file.example.com", "maxBackoffMs": 1234})";
    }
    auto loaded = tether::load_configuration(path);
    assert(loaded.rest_url == "https://file.example.com");
    assert(loaded.max_backoff == 1234ms);
    std::filesystem::remove(path);

    std::cout << "  Configuration test passed!" << std::endl;
}

void test_scheduler_dispatch() {
    std::cout << "Testing scheduler dispatch..." << std::endl;

    auto thread_sched = std::make_shared<tether::std_thread_scheduler>();
    std::atomic<int> callback_count{0};
    std::atomic<bool> on_scheduler_thread{false};
    std::condition_variable cv;
    std::mutex cv_mutex;

    thread_sched->invoke([&] {
        on_scheduler_thread = thread_sched->is_on_thread();
        callback_count++;
        cv.notify_one();
    });
    {
        std::unique_lock<std::mutex> lock(cv_mutex);
        cv.wait_for(lock, std::chrono::seconds(1), [&] { return callback_count > 0; });
    }
    assert(callback_count == 1);
    assert(on_scheduler_thread);
    assert(!thread_sched->is_on_thread());

    // Queued work, including work queued by work, runs on process_pending()
    tether::main_thread_scheduler main_sched;
    int order = 0;
    main_sched.invoke([&] {
        order = order * 10 + 1;
        main_sched.invoke([&] { order = order * 10 + 3; });
    });
    main_sched.invoke([&] { order = order * 10 + 2; });
    assert(order == 0);
    assert(main_sched.pending_count() == 2);
    assert(main_sched.process_pending() == 3);
    assert(order == 123);

    std::cout << "  Scheduler dispatch test passed!" << std::endl;
}

// ============================================================================
// Record store
// ============================================================================

void test_record_store() {
    std::cout << "Testing record store..." << std::endl;

    auto backing = std::make_shared<tether::null_backing_store>();
    tether::record_store store(backing);
    auto t = tether::from_millis(1'700'000'000'000);

    auto a = make_record("a", "A", "U", t);
    auto b = make_record("b", "B", "U", t);
    auto early = make_record("e", "Early", "U", t - 1ms);
    store.upsert(a);
    store.upsert(b);
    store.upsert(early);
    store.upsert(make_record("v", "Other", "V", t));

    // Creation order, ties by insertion
    auto listed = store.list("U");
    assert(listed.size() == 3);
    assert(listed[0].id == "e");
    assert(listed[1].id == "a");
    assert(listed[2].id == "b");

    int calls = 0;
    size_t last_size = 0;
    auto token = store.subscribe("U", [&](const std::vector<tether::record>& visible) {
        calls++;
        last_size = visible.size();
    });

    store.upsert(make_record("c", "C", "U", t + 1ms));
    assert(calls == 1);
    assert(last_size == 4);

    // Other owners do not notify
    store.upsert(make_record("w", "W", "V", t));
    assert(calls == 1);

    auto tomb = store.mark_deleted("a", t);
    assert(tomb.has_value());
    assert(tomb->deleted);
    assert(tomb->updated_at > a.updated_at);
    assert(calls == 2);
    assert(last_size == 3);
    assert(store.get("a")->deleted);
    assert(store.list("U").size() == 3);
    assert(!store.mark_deleted("missing", t).has_value());

    // Purging a tombstone does not change the visible list
    assert(store.purge("a"));
    assert(!store.get("a").has_value());
    assert(calls == 2);
    assert(!store.purge("a"));

    token.unregister();
    store.upsert(make_record("d", "D", "U", t));
    assert(calls == 2);

    std::cout << "  Record store test passed!" << std::endl;
}

// ============================================================================
// Sync queue
// ============================================================================

void test_sync_queue_coalescing() {
    std::cout << "Testing sync queue coalescing..." << std::endl;

    auto backing = std::make_shared<tether::null_backing_store>();
    tether::manual_timer_service clock;
    tether::sync_queue queue(backing, [&] { return clock.now(); });
    auto r = make_record("r1", "A", "U", clock.now());

    // Update folds into the unsent create
    auto created = queue.enqueue(tether::operation_kind::create, "r1", r);
    r.name = "B";
    auto merged = queue.enqueue(tether::operation_kind::update, "r1", r);
    assert(queue.size() == 1);
    assert(merged.id == created.id);
    assert(merged.kind == tether::operation_kind::create);
    assert(merged.payload.name == "B");
    assert(merged.revision == 1);
    assert(merged.created_at == created.created_at);

    // Acknowledging an older revision keeps the operation as an update
    assert(queue.mark_synced(created.id, 0) == tether::ack_result::requeued);
    assert(queue.find(created.id)->kind == tether::operation_kind::update);
    assert(queue.mark_synced(created.id, 1) == tether::ack_result::removed);
    assert(queue.size() == 0);

    // Delete supersedes
    auto create2 = queue.enqueue(tether::operation_kind::create, "r2", make_record("r2", "X", "U", clock.now()));
    auto del = queue.enqueue(tether::operation_kind::remove, "r2", make_record("r2", "X", "U", clock.now()));
    assert(queue.size() == 1);
    assert(del.id != create2.id);
    assert(del.kind == tether::operation_kind::remove);
    assert(del.status == tether::sync_status::pending);
    assert(!queue.find(create2.id).has_value());
    assert(queue.mark_synced(create2.id, 0) == tether::ack_result::missing);

    // A write after the delete leaves the delete in place
    auto after = queue.enqueue(tether::operation_kind::update, "r2", make_record("r2", "Y", "U", clock.now()));
    assert(after.id == del.id);
    assert(after.kind == tether::operation_kind::remove);
    assert(queue.find_for_record("r2")->payload.name == "X");

    // Status transitions
    assert(queue.mark_error(del.id, "offline", tether::failure_kind::network));
    auto failed = queue.find(del.id);
    assert(failed->status == tether::sync_status::error);
    assert(failed->attempts == 1);
    assert(failed->last_attempt_at.has_value());
    assert(queue.pending().empty());
    assert(queue.failed().size() == 1);
    assert(queue.has_blocking_operation("r2"));

    assert(queue.mark_retrying(del.id));
    assert(queue.pending().size() == 1);
    assert(!queue.mark_retrying(del.id));

    assert(queue.mark_error(del.id, "rejected", tether::failure_kind::server_rejected));
    assert(queue.find(del.id)->attempts == 2);
    assert(!queue.has_blocking_operation("r2"));

    assert(queue.mark_pending(del.id));
    auto rearmed = queue.find(del.id);
    assert(rearmed->status == tether::sync_status::pending);
    assert(rearmed->attempts == 0);
    assert(rearmed->failure == tether::failure_kind::none);

    // A failure for a payload that has since been replaced does not count
    clock.advance(10ms);
    auto c3 = queue.enqueue(tether::operation_kind::create, "r3", make_record("r3", "P", "U", clock.now()));
    queue.enqueue(tether::operation_kind::update, "r3", make_record("r3", "Q", "U", clock.now()));
    assert(queue.mark_error(c3.id, "timeout", tether::failure_kind::timeout, 0));
    assert(queue.find(c3.id)->status == tether::sync_status::pending);
    assert(queue.find(c3.id)->attempts == 0);

    // Oldest first
    auto pending = queue.pending();
    assert(pending.size() == 2);
    assert(pending[0].record_id == "r2");
    assert(pending[1].record_id == "r3");

    assert(queue.discard(c3.id));
    assert(!queue.discard(c3.id));
    assert(queue.size() == 1);

    std::cout << "  Sync queue coalescing test passed!" << std::endl;
}

void test_sync_queue_persistence() {
    std::cout << "Testing sync queue persistence..." << std::endl;

    auto path = temp_db_path("tether_queue_test.sqlite");
    tether::manual_timer_service clock;
    auto r1 = make_record("rec-1", "Plank", "U", clock.now());
    auto r2 = make_record("rec-2", "Dips", "U", clock.now());
    std::string op1_id;
    std::string op2_id;

    {
        auto store = std::make_shared<tether::sqlite_backing_store>(path);
        tether::sync_queue queue(store, [&] { return clock.now(); });
        op1_id = queue.enqueue(tether::operation_kind::create, "rec-1", r1).id;
        queue.mark_error(op1_id, "timed out", tether::failure_kind::timeout);
        queue.mark_retrying(op1_id);
        op2_id = queue.enqueue(tether::operation_kind::update, "rec-2", r2).id;
        store->save_record(r1);
    }

    {
        auto store = std::make_shared<tether::sqlite_backing_store>(path);
        tether::sync_queue queue(store, [&] { return clock.now(); });
        queue.load();
        assert(queue.size() == 2);

        // Interrupted attempt comes back as a retryable error
        auto op1 = queue.find(op1_id);
        assert(op1.has_value());
        assert(op1->status == tether::sync_status::error);
        assert(op1->failure == tether::failure_kind::timeout);
        assert(op1->attempts == 1);
        assert(op1->payload == r1);

        auto op2 = queue.find_for_record("rec-2");
        assert(op2.has_value());
        assert(op2->id == op2_id);
        assert(op2->kind == tether::operation_kind::update);
        assert(op2->status == tether::sync_status::pending);

        auto records = store->load_records();
        assert(records.size() == 1);
        assert(records[0] == r1);

        // Replacing delete keeps a single row per record
        queue.enqueue(tether::operation_kind::remove, "rec-1", r1);
        assert(store->load_operations().size() == 2);

        store->clear();
        assert(store->load_operations().empty());
        assert(store->load_records().empty());
    }

    temp_db_path("tether_queue_test.sqlite");
    std::cout << "  Sync queue persistence test passed!" << std::endl;
}

// ============================================================================
// Remote sync client
// ============================================================================

void test_remote_requests() {
    std::cout << "Testing remote sync client requests..." << std::endl;

    auto backend = std::make_shared<tether_test::fake_backend>();
    auto sched = std::make_shared<tether::immediate_scheduler>();
    auto timers = std::make_shared<tether::manual_timer_service>();
    auto users = std::make_shared<tether::user_context>(std::string("U"));
    auto config = harness::make_config(harness::options{}, sched);
    tether::remote_sync_client client(config, std::make_shared<tether_test::fake_network_factory>(backend),
                                      users, timers, sched);

    tether::sync_operation op;
    op.id = "op-1";
    op.kind = tether::operation_kind::create;
    op.record_id = tether::generate_id();
    op.payload = make_record(op.record_id, "Burpees", "U", timers->now());

    auto create = client.build_request(op, "U");
    assert(create.method == "POST");
    assert(create.url == "https://backend.test/rest/v1/records");
    assert(create.headers.at("apikey") == "anon-key");
    assert(create.headers.at("Authorization") == "Bearer session-token");
    assert(create.headers.at("Content-Type") == "application/json");
    assert(*tether::record::from_json(create.body_string()) == op.payload);

    op.kind = tether::operation_kind::update;
    auto update = client.build_request(op, "U");
    assert(update.method == "POST");
    assert(update.url == "https://backend.test/rest/v1/records?on_conflict=id");
    assert(update.headers.at("Prefer").find("resolution=merge-duplicates") != std::string::npos);

    op.kind = tether::operation_kind::remove;
    auto del = client.build_request(op, "U");
    assert(del.method == "DELETE");
    assert(del.url == "https://backend.test/rest/v1/records?id=eq." + op.record_id + "&owner_id=eq.U");
    assert(del.body.empty());

    using fk = tether::failure_kind;
    assert(tether::remote_sync_client::classify_status(201) == fk::none);
    assert(tether::remote_sync_client::classify_status(204) == fk::none);
    assert(tether::remote_sync_client::classify_status(0) == fk::network);
    assert(tether::remote_sync_client::classify_status(503) == fk::network);
    assert(tether::remote_sync_client::classify_status(429) == fk::network);
    assert(tether::remote_sync_client::classify_status(408) == fk::timeout);
    assert(tether::remote_sync_client::classify_status(504) == fk::timeout);
    assert(tether::remote_sync_client::classify_status(401) == fk::auth_mismatch);
    assert(tether::remote_sync_client::classify_status(403) == fk::auth_mismatch);
    assert(tether::remote_sync_client::classify_status(409) == fk::server_rejected);
    assert(tether::remote_sync_client::classify_status(422) == fk::server_rejected);

    // Push round trip
    op.kind = tether::operation_kind::create;
    std::optional<tether::push_result> result;
    client.push(op, [&](tether::push_result r) { result = r; });
    assert(result.has_value() && result->success);
    assert(backend->rows.count(op.record_id) == 1);

    // Duplicate insert is rejected by the backend
    result.reset();
    client.push(op, [&](tether::push_result r) { result = r; });
    assert(result.has_value() && !result->success);
    assert(result->failure == fk::server_rejected);

    // Another owner's operation never reaches the network
    size_t sent = backend->requests.size();
    op.payload.owner_id = "V";
    result.reset();
    client.push(op, [&](tether::push_result r) { result = r; });
    assert(result.has_value() && result->failure == fk::auth_mismatch);
    assert(backend->requests.size() == sent);

    // Fetch returns only the session owner's rows
    backend->rows["foreign"] = make_record("foreign", "Theirs", "V", timers->now());
    auto fetch = client.build_fetch_request("U");
    assert(fetch.method == "GET");
    assert(fetch.url == "https://backend.test/rest/v1/records?select=*&owner_id=eq.U&order=created_at.asc");
    assert(fetch.headers.at("apikey") == "anon-key");
    assert(fetch.body.empty());

    std::optional<tether::fetch_result> fetched;
    client.fetch_rows("U", [&](tether::fetch_result r) { fetched = r; });
    assert(fetched.has_value() && fetched->success);
    assert(fetched->rows.size() == 1);
    assert(fetched->rows[0].id == op.record_id);
    assert(fetched->rows[0].name == "Burpees");
    assert(fetched->rows[0].owner_id == "U");

    sent = backend->requests.size();
    fetched.reset();
    client.fetch_rows("V", [&](tether::fetch_result r) { fetched = r; });
    assert(fetched.has_value() && !fetched->success);
    assert(fetched->failure == fk::auth_mismatch);
    assert(backend->requests.size() == sent);

    backend->scripted_statuses = {503};
    fetched.reset();
    client.fetch_rows("U", [&](tether::fetch_result r) { fetched = r; });
    assert(fetched.has_value() && !fetched->success);
    assert(fetched->failure == fk::network);
    assert(fetched->rows.empty());
    sent = backend->requests.size();

    // No session at all
    users->set_owner(std::nullopt);
    op.payload.owner_id = "U";
    result.reset();
    client.push(op, [&](tether::push_result r) { result = r; });
    assert(result.has_value() && result->failure == fk::auth_mismatch);
    assert(backend->requests.size() == sent);

    std::cout << "  Remote request test passed!" << std::endl;
}

void test_change_stream_reconnect() {
    std::cout << "Testing change stream reconnect..." << std::endl;

    auto backend = std::make_shared<tether_test::fake_backend>();
    auto sched = std::make_shared<tether::immediate_scheduler>();
    auto timers = std::make_shared<tether::manual_timer_service>();
    auto users = std::make_shared<tether::user_context>(std::string("U"));
    harness::options opts;
    opts.realtime = true;
    auto config = harness::make_config(opts, sched);
    tether::remote_sync_client client(config, std::make_shared<tether_test::fake_network_factory>(backend),
                                      users, timers, sched);

    std::vector<tether::change_event> received;
    auto stream = client.open_change_stream("U", [&](const tether::change_event& e) {
        received.push_back(e);
    });
    assert(stream != nullptr);
    assert(stream->is_connected());
    assert(stream->owner_id() == "U");
    assert(backend->realtime_connects == 1);

    auto* transport = backend->last_transport();
    assert(transport != nullptr);
    assert(transport->url() == "wss://backend.test/realtime");
    assert(transport->headers().at("apikey") == "anon-key");
    assert(transport->sent().size() == 1);
    assert(transport->sent()[0].find("\"type\":\"subscribe\"") != std::string::npos);
    assert(transport->sent()[0].find("\"filter\":\"owner_id=eq.U\"") != std::string::npos);

    tether::change_event event;
    event.event_type = tether::change_event::type::insert;
    event.row = make_record("remote-1", "Rows", "U", timers->now());
    transport->simulate_change(event);
    transport->simulate_raw("not json");
    transport->simulate_raw(R"({"type":"heartbeat"})");
    assert(received.size() == 1);
    assert(received[0].event_type == tether::change_event::type::insert);
    assert(received[0].row == event.row);

    // Drop: 1s, then 2s after a refused attempt
    transport->simulate_drop();
    assert(!stream->is_connected());
    assert(stream->reconnect_attempts() == 1);
    assert(timers->scheduled_count() == 1);

    backend->refuse_realtime = true;
    timers->advance(999ms);
    assert(backend->realtime_connects == 1);
    timers->advance(1ms);
    assert(backend->realtime_connects == 2);
    assert(!stream->is_connected());
    assert(stream->reconnect_attempts() == 2);

    backend->refuse_realtime = false;
    timers->advance(1999ms);
    assert(backend->realtime_connects == 2);
    timers->advance(1ms);
    assert(backend->realtime_connects == 3);
    assert(stream->is_connected());
    assert(stream->reconnect_attempts() == 0);
    assert(transport->sent().size() == 2);

    // Closing cancels a pending reconnect and silences the handler
    transport->simulate_drop();
    assert(timers->scheduled_count() == 1);
    stream->close();
    assert(timers->scheduled_count() == 0);
    transport->simulate_change(event);
    assert(received.size() == 1);

    // Gives up after max_reconnect_attempts
    config.max_reconnect_attempts = 1;
    tether::remote_sync_client limited(config, std::make_shared<tether_test::fake_network_factory>(backend),
                                       users, timers, sched);
    backend->refuse_realtime = true;
    backend->realtime_connects = 0;
    auto failing = limited.open_change_stream("U", [](const tether::change_event&) {});
    assert(failing != nullptr);
    assert(backend->realtime_connects == 1);
    assert(timers->scheduled_count() == 1);
    timers->advance(1000ms);
    assert(backend->realtime_connects == 2);
    assert(timers->scheduled_count() == 0);
    assert(!failing->is_connected());
    assert(failing->gave_up());

    // resume() starts a fresh round after giving up
    backend->refuse_realtime = false;
    failing->resume();
    assert(backend->realtime_connects == 3);
    assert(failing->is_connected());
    assert(!failing->gave_up());
    assert(failing->reconnect_attempts() == 0);
    failing->resume();
    assert(backend->realtime_connects == 3);

    // ... and skips a pending backoff wait
    backend->last_transport()->simulate_drop();
    assert(timers->scheduled_count() == 1);
    failing->resume();
    assert(timers->scheduled_count() == 0);
    assert(backend->realtime_connects == 4);
    assert(failing->is_connected());

    // No realtime URL, no stream
    config.realtime_url.clear();
    tether::remote_sync_client silent(config, std::make_shared<tether_test::fake_network_factory>(backend),
                                      users, timers, sched);
    assert(silent.open_change_stream("U", [](const tether::change_event&) {}) == nullptr);

    std::cout << "  Change stream reconnect test passed!" << std::endl;
}

// ============================================================================
// Repository
// ============================================================================

void test_create_offline_then_sync() {
    std::cout << "Testing create offline, then sync..." << std::endl;

    harness::options opts;
    opts.online = false;
    harness h(opts);

    auto r = h.repo->create("Push-ups", "U");
    h.pump();
    assert(r.name == "Push-ups");
    assert(!r.deleted);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::pending);

    auto listed = h.repo->list("U");
    assert(listed.size() == 1);
    assert(listed[0] == r);
    assert(h.backend->requests.empty());

    h.repo->set_network_status(true);
    h.pump();
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);
    assert(h.repo->get_pending_operations().empty());
    assert(h.backend->requests.size() == 1);
    assert(h.backend->requests[0].method == "POST");
    assert(h.backend->rows.at(r.id).name == "Push-ups");
    assert(h.backend->rows.at(r.id).owner_id == "U");

    // Synced operations are never pushed again
    h.repo->flush();
    h.advance(30000ms);
    assert(h.backend->requests.size() == 1);

    std::cout << "  Offline create test passed!" << std::endl;
}

void test_create_update_delete_before_sync() {
    std::cout << "Testing create, update, delete before sync..." << std::endl;

    harness h;
    auto r = h.repo->create("X", "U");
    h.repo->update(r.id, rename_to("Y"));
    h.repo->remove(r.id);

    auto pending = h.repo->get_pending_operations();
    assert(pending.size() == 1);
    assert(pending[0].kind == tether::operation_kind::remove);

    h.pump();
    assert(h.repo->get_pending_operations().empty());
    assert(h.repo->list("U").empty());
    assert(!h.repo->get(r.id).has_value());
    assert(!h.repo->get_sync_status(r.id).has_value());
    assert(h.backend->requests.size() == 1);
    assert(h.backend->requests[0].method == "DELETE");
    assert(!h.backend->saw_text("\"X\""));
    assert(!h.backend->saw_text("\"Y\""));

    std::cout << "  Delete-before-sync test passed!" << std::endl;
}

void test_coalescing_before_flush() {
    std::cout << "Testing coalescing before flush..." << std::endl;

    harness h;
    auto r = h.repo->create("Jumping jacks", "U");
    auto first = h.repo->update(r.id, rename_to("Jumping Jacks"));
    auto second = h.repo->update(r.id, rename_to("Star jumps"));
    assert(first.updated_at > r.updated_at);
    assert(second.updated_at > first.updated_at);

    auto pending = h.repo->get_pending_operations();
    assert(pending.size() == 1);
    assert(pending[0].kind == tether::operation_kind::create);
    assert(pending[0].payload.name == "Star jumps");
    assert(pending[0].attempts == 0);

    h.pump();
    assert(h.backend->requests.size() == 1);
    assert(h.backend->rows.at(r.id).name == "Star jumps");
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);

    std::cout << "  Coalescing test passed!" << std::endl;
}

void test_sequential_updates_order() {
    std::cout << "Testing sequential update ordering..." << std::endl;

    harness h;
    h.backend->deferred = true;

    auto r = h.repo->create("A", "U");
    h.pump();
    assert(h.backend->held.size() == 1);
    assert(h.repo->sync_scheduler().in_flight_count() == 1);

    // One push per record in flight
    h.repo->update(r.id, rename_to("B"));
    h.pump();
    assert(h.backend->requests.size() == 1);

    h.backend->release_all();
    h.pump();
    assert(h.backend->requests.size() == 2);

    h.repo->update(r.id, rename_to("C"));
    h.pump();
    assert(h.backend->requests.size() == 2);

    h.backend->release_all();
    h.pump();
    assert(h.backend->requests.size() == 3);

    h.backend->release_all();
    h.pump();
    assert(h.repo->get_pending_operations().empty());
    assert(h.repo->sync_scheduler().in_flight_count() == 0);

    const auto& reqs = h.backend->requests;
    assert(tether::record::from_json(reqs[0].body_string())->name == "A");
    assert(reqs[0].url.find("on_conflict") == std::string::npos);
    assert(tether::record::from_json(reqs[1].body_string())->name == "B");
    assert(reqs[1].url.find("on_conflict=id") != std::string::npos);
    assert(tether::record::from_json(reqs[2].body_string())->name == "C");
    assert(h.backend->rows.at(r.id).name == "C");
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);

    std::cout << "  Ordering test passed!" << std::endl;
}

void test_offline_durability() {
    std::cout << "Testing offline durability..." << std::endl;

    harness::options opts;
    opts.online = false;
    harness h(opts);

    std::vector<tether::record> created;
    for (int i = 0; i < 5; ++i) {
        created.push_back(h.repo->create("Item " + std::to_string(i), "U"));
    }
    h.advance(120000ms);

    auto listed = h.repo->list("U");
    assert(listed.size() == 5);
    for (size_t i = 0; i < listed.size(); ++i) {
        assert(listed[i].id == created[i].id);
        assert(h.repo->get_sync_status(listed[i].id) == tether::sync_status::pending);
    }
    assert(h.backend->requests.empty());

    h.repo->set_network_status(true);
    h.pump();
    for (const auto& r : created) {
        assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);
    }
    assert(h.backend->rows.size() == 5);

    std::cout << "  Offline durability test passed!" << std::endl;
}

void test_soft_delete_lifecycle() {
    std::cout << "Testing soft delete lifecycle..." << std::endl;

    harness h;
    h.backend->deferred = true;

    auto r = h.repo->create("Crunches", "U");
    h.settle();
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);

    h.repo->remove(r.id);
    assert(h.repo->list("U").empty());
    auto tomb = h.repo->get(r.id);
    assert(tomb.has_value() && tomb->deleted);
    assert(tomb->updated_at > r.updated_at);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::pending);
    assert(throws_not_found([&] { h.repo->remove(r.id); }));
    assert(throws_not_found([&] { h.repo->update(r.id, rename_to("Back")); }));

    // Retained while the delete is in flight
    h.pump();
    assert(h.backend->held.size() == 1);
    assert(h.repo->get(r.id).has_value());

    h.settle();
    assert(!h.repo->get(r.id).has_value());
    assert(!h.repo->get_sync_status(r.id).has_value());
    assert(h.backend->rows.empty());
    assert(h.backend->requests.back().method == "DELETE");

    std::cout << "  Soft delete test passed!" << std::endl;
}

void test_validation() {
    std::cout << "Testing validation..." << std::endl;

    harness h;
    assert(throws_validation([&] { h.repo->create("", "U"); }));
    assert(throws_validation([&] { h.repo->create("   ", "U"); }));
    assert(throws_validation([&] { h.repo->create(std::string(101, 'a'), "U"); }));
    assert(throws_validation([&] { h.repo->create("Sit-ups", ""); }));
    assert(h.repo->list("U").empty());
    assert(h.repo->get_pending_operations().empty());

    auto longest = h.repo->create(std::string(100, 'a'), "U");
    assert(longest.name.size() == 100);

    // Length counts characters, not bytes
    std::string accented;
    for (int i = 0; i < 100; ++i) accented += "\xC3\xA9";
    auto wide = h.repo->create(accented, "U");
    assert(wide.name.size() == 200);
    assert(throws_validation([&] { h.repo->create(accented + "\xC3\xA9", "U"); }));
    assert(throws_validation([&] { h.repo->update(wide.id, rename_to(accented + "e")); }));
    h.repo->update(wide.id, rename_to("\xE2\x9C\x93" + std::string(99, 'b')));
    assert(h.repo->get(wide.id)->name.size() == 102);
    auto padded = h.repo->create("   Sit-ups  ", "U");
    assert(padded.name == "Sit-ups");

    assert(throws_validation([&] { h.repo->update(padded.id, tether::record_patch{}); }));
    assert(throws_validation([&] { h.repo->update(padded.id, rename_to("  ")); }));
    assert(throws_validation([&] { h.repo->update(padded.id, rename_to(std::string(101, 'b'))); }));
    assert(throws_not_found([&] { h.repo->update("missing", rename_to("x")); }));
    assert(throws_not_found([&] { h.repo->remove("missing"); }));
    assert(h.repo->get(padded.id)->name == "Sit-ups");

    std::cout << "  Validation test passed!" << std::endl;
}

void test_subscribe() {
    std::cout << "Testing subscribe..." << std::endl;

    harness h;
    int calls = 0;
    std::vector<tether::record> last;
    auto token = h.repo->subscribe("U", [&](const std::vector<tether::record>& visible) {
        calls++;
        last = visible;
    });

    auto r = h.repo->create("Pull-ups", "U");
    assert(calls == 1);
    assert(last.size() == 1 && last[0].name == "Pull-ups");

    h.repo->update(r.id, rename_to("Chin-ups"));
    assert(calls == 2);
    assert(last[0].name == "Chin-ups");

    assert(throws_validation([&] { h.repo->create("Not mine", "V"); }));
    assert(calls == 2);

    h.repo->remove(r.id);
    assert(calls == 3);
    assert(last.empty());

    token.unregister();
    h.repo->create("Rows", "U");
    assert(calls == 3);

    std::cout << "  Subscribe test passed!" << std::endl;
}

void test_retry_backoff() {
    std::cout << "Testing retry backoff..." << std::endl;

    harness h;
    auto& retry = h.repo->sync_scheduler();
    assert(retry.backoff_for(1) == 1000ms);
    assert(retry.backoff_for(2) == 2000ms);
    assert(retry.backoff_for(6) == 32000ms);
    assert(retry.backoff_for(7) == 60000ms);
    assert(retry.backoff_for(100) == 60000ms);

    h.backend->scripted_statuses = {503, 503};
    auto r = h.repo->create("Lunges", "U");
    h.pump();
    assert(h.backend->requests.size() == 1);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::error);
    auto op = h.repo->get_pending_operations().at(0);
    assert(op.failure == tether::failure_kind::network);
    assert(op.attempts == 1);

    // Not before the window
    h.repo->flush();
    h.pump();
    h.advance(999ms);
    h.repo->flush();
    h.pump();
    assert(h.backend->requests.size() == 1);

    h.advance(1ms);
    h.repo->flush();
    h.pump();
    assert(h.backend->requests.size() == 2);
    assert(h.repo->get_pending_operations().at(0).attempts == 2);

    h.advance(1999ms);
    h.repo->flush();
    h.pump();
    assert(h.backend->requests.size() == 2);

    h.advance(1ms);
    h.repo->flush();
    h.pump();
    assert(h.backend->requests.size() == 3);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);

    std::cout << "  Retry backoff test passed!" << std::endl;
}

void test_recurring_retry() {
    std::cout << "Testing recurring retry pass..." << std::endl;

    harness h;
    h.backend->scripted_statuses = {504};
    auto r = h.repo->create("Burpees", "U");
    h.pump();
    assert(h.repo->get_pending_operations().at(0).failure == tether::failure_kind::timeout);

    // The periodic pass picks the entry up without a flush
    h.advance(5000ms);
    assert(h.backend->requests.size() == 2);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);

    h.repo->sync_scheduler().stop();
    assert(!h.repo->sync_scheduler().is_running());
    assert(h.timers->scheduled_count() == 0);

    std::cout << "  Recurring retry test passed!" << std::endl;
}

void test_non_retryable_failures() {
    std::cout << "Testing non-retryable failures..." << std::endl;

    harness h;
    int failures = 0;
    int synced = 0;
    h.repo->set_on_operation_failed([&](const tether::sync_operation&, const tether::push_result& result) {
        failures++;
        assert(!result.success);
    });
    h.repo->set_on_operation_synced([&](const tether::sync_operation&) { synced++; });

    h.backend->scripted_statuses = {422};
    auto r = h.repo->create("Deadlift", "U");
    h.pump();
    assert(failures == 1);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::error);
    assert(h.repo->get_pending_operations().at(0).failure == tether::failure_kind::server_rejected);

    // Stays put across passes
    h.advance(10000ms);
    h.repo->flush();
    h.pump();
    assert(h.backend->requests.size() == 1);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::error);

    h.repo->retry_failed();
    h.pump();
    assert(h.backend->requests.size() == 2);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);
    assert(synced == 1);

    // Discard drops the operation but keeps the local record
    h.backend->scripted_statuses = {403};
    auto other = h.repo->create("Bench", "U");
    h.pump();
    auto stuck = h.repo->get_pending_operations();
    assert(stuck.size() == 1);
    assert(stuck[0].failure == tether::failure_kind::auth_mismatch);
    assert(h.repo->discard_operation(stuck[0].id));
    assert(!h.repo->discard_operation(stuck[0].id));
    assert(h.repo->get_pending_operations().empty());
    assert(h.repo->get(other.id).has_value());

    std::cout << "  Non-retryable test passed!" << std::endl;
}

void test_session_scope() {
    std::cout << "Testing session scope..." << std::endl;

    harness::options opts;
    opts.owner = std::nullopt;
    harness h(opts);

    // No session: nothing is pushed, any owner may be written locally
    auto r = h.repo->create("Squats", "U");
    auto foreign = h.repo->create("Not mine", "V");
    h.pump();
    h.advance(10000ms);
    assert(h.backend->requests.empty());
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::pending);
    assert(h.repo->get(foreign.id).has_value());

    h.users->set_owner(std::string("U"));
    h.pump();
    assert(h.backend->requests.size() == 1);
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);

    // Another owner's record fails locally and is hidden from the session
    auto outstanding = h.repo->get_pending_operations();
    assert(outstanding.size() == 1);
    assert(outstanding[0].record_id == foreign.id);
    assert(outstanding[0].status == tether::sync_status::error);
    assert(outstanding[0].failure == tether::failure_kind::auth_mismatch);
    assert(!h.repo->get(foreign.id).has_value());
    assert(!h.repo->get_sync_status(foreign.id).has_value());
    assert(throws_not_found([&] { h.repo->update(foreign.id, rename_to("Mine now")); }));
    assert(throws_not_found([&] { h.repo->remove(foreign.id); }));
    assert(h.repo->list("V").size() == 1);
    assert(h.repo->list("V")[0].name == "Not mine");

    // Writes for another owner are refused while signed in
    assert(throws_validation([&] { h.repo->create("Also not mine", "V"); }));
    assert(h.repo->list("V").size() == 1);
    assert(h.backend->requests.size() == 1);

    // Back to the owner: visible again
    h.users->set_owner(std::string("V"));
    h.pump();
    assert(h.repo->get(foreign.id).has_value());
    assert(!h.repo->get(r.id).has_value());

    std::cout << "  Session scope test passed!" << std::endl;
}
void test_realtime_protection() {
    std::cout << "Testing realtime protection..." << std::endl;

    harness::options opts;
    opts.realtime = true;
    harness h(opts);
    assert(h.repo->realtime().is_streaming());
    auto* transport = h.backend->last_transport();
    assert(transport != nullptr);

    h.backend->deferred = true;
    auto r = h.repo->create("Mine", "U");
    h.pump();

    tether::change_event echo;
    echo.event_type = tether::change_event::type::update;
    echo.row = r;
    echo.row.name = "Server";
    echo.row.updated_at = r.updated_at + 5ms;
    transport->simulate_change(echo);
    h.pump();

    assert(h.repo->get(r.id)->name == "Mine");
    assert(h.repo->realtime().buffered_count() == 1);

    h.settle();
    assert(h.repo->get_sync_status(r.id) == tether::sync_status::synced);
    assert(h.repo->realtime().buffered_count() == 0);
    assert(h.repo->get(r.id)->name == "Server");

    // A terminal failure also releases held events
    h.backend->scripted_statuses = {422};
    auto rejected = h.repo->create("Rejected", "U");
    h.pump();
    assert(h.backend->held.size() == 1);
    tether::change_event later;
    later.event_type = tether::change_event::type::update;
    later.row = rejected;
    later.row.name = "Fixed upstream";
    later.row.updated_at = rejected.updated_at + 1ms;
    transport->simulate_change(later);
    h.pump();
    assert(h.repo->realtime().buffered_count() == 1);
    h.settle();
    assert(h.repo->get_sync_status(rejected.id) == tether::sync_status::error);
    assert(h.repo->realtime().buffered_count() == 0);
    assert(h.repo->get(rejected.id)->name == "Fixed upstream");

    std::cout << "  Realtime protection test passed!" << std::endl;
}

void test_realtime_apply() {
    std::cout << "Testing realtime apply..." << std::endl;

    harness::options opts;
    opts.realtime = true;
    harness h(opts);
    auto* transport = h.backend->last_transport();
    assert(transport != nullptr);
    assert(transport->sent()[0].find("owner_id=eq.U") != std::string::npos);

    auto now = h.timers->now();
    tether::change_event insert;
    insert.event_type = tether::change_event::type::insert;
    insert.row = make_record("remote-1", "From server", "U", now);
    transport->simulate_change(insert);
    h.pump();
    assert(h.repo->list("U").size() == 1);
    assert(h.repo->get_sync_status("remote-1") == tether::sync_status::synced);
    assert(h.repo->get_pending_operations().empty());

    // Older than local: dropped
    tether::change_event stale = insert;
    stale.event_type = tether::change_event::type::update;
    stale.row.name = "Old";
    stale.row.updated_at = now - 1000ms;
    transport->simulate_change(stale);
    h.pump();
    assert(h.repo->get("remote-1")->name == "From server");

    // Another owner: ignored
    tether::change_event foreign;
    foreign.event_type = tether::change_event::type::insert;
    foreign.row = make_record("remote-2", "Theirs", "V", now);
    transport->simulate_change(foreign);
    h.pump();
    assert(!h.repo->get("remote-2").has_value());

    // Delete carrying only the key removes the row outright
    transport->simulate_raw(R"({"type":"change","event":"DELETE","row":{"id":"remote-1"}})");
    h.pump();
    assert(h.repo->list("U").empty());
    assert(!h.repo->get("remote-1").has_value());
    assert(!h.repo->get_sync_status("remote-1").has_value());

    // A late insert for the deleted id stays out
    transport->simulate_change(insert);
    h.pump();
    assert(h.repo->list("U").empty());

    // A failed local write keeps a tombstone so the failure stays inspectable
    h.backend->scripted_statuses = {422};
    auto rejected = h.repo->create("Rejected", "U");
    h.pump();
    assert(h.repo->get_sync_status(rejected.id) == tether::sync_status::error);
    tether::change_event gone;
    gone.event_type = tether::change_event::type::remove;
    gone.row = rejected;
    gone.row.updated_at = rejected.updated_at + 1ms;
    transport->simulate_change(gone);
    h.pump();
    assert(h.repo->get(rejected.id)->deleted);
    assert(h.repo->list("U").empty());
    assert(h.repo->get_sync_status(rejected.id) == tether::sync_status::error);

    // Owner switch reopens the stream for the new owner
    h.users->set_owner(std::string("V"));
    h.pump();
    assert(h.backend->realtime_connects == 2);
    auto* second = h.backend->last_transport();
    assert(second != nullptr && second != transport);
    assert(second->sent()[0].find("owner_id=eq.V") != std::string::npos);
    second->simulate_change(foreign);
    h.pump();
    assert(h.repo->get("remote-2").has_value());
    assert(h.repo->list("V").size() == 1);

    h.users->set_owner(std::nullopt);
    assert(!h.repo->realtime().is_streaming());

    std::cout << "  Realtime apply test passed!" << std::endl;
}

void test_deleted_record_stays_deleted() {
    std::cout << "Testing deleted record stays deleted..." << std::endl;

    harness::options opts;
    opts.realtime = true;
    harness h(opts);
    auto* transport = h.backend->last_transport();
    h.backend->deferred = true;

    auto r = h.repo->create("Push-ups", "U");
    h.pump();
    assert(h.backend->held.size() == 1);

    // Echo of the create arrives while it is still in flight
    tether::change_event echo;
    echo.event_type = tether::change_event::type::insert;
    echo.row = r;
    transport->simulate_change(echo);
    h.pump();
    assert(h.repo->realtime().buffered_count() == 1);

    h.repo->remove(r.id);
    h.settle();
    assert(h.count_requests("DELETE") == 1);
    assert(h.backend->rows.empty());
    assert(h.repo->get_pending_operations().empty());
    assert(h.repo->realtime().buffered_count() == 0);
    assert(!h.repo->get(r.id).has_value());
    assert(h.repo->list("U").empty());

    // A late copy of the same echo
    transport->simulate_change(echo);
    h.pump();
    assert(!h.repo->get(r.id).has_value());
    assert(h.repo->list("U").empty());

    std::cout << "  Deleted record stays deleted test passed!" << std::endl;
}

void test_stream_resumes_when_online() {
    std::cout << "Testing change stream resume on reconnect..." << std::endl;

    harness::options opts;
    opts.realtime = true;
    harness h(opts);
    h.pump();
    assert(h.repo->realtime().is_streaming());
    auto* transport = h.backend->last_transport();

    h.repo->set_network_status(false);
    h.backend->refuse_realtime = true;
    transport->simulate_drop();
    assert(!h.repo->realtime().is_streaming());

    for (int i = 0; i < 120; ++i) h.advance(1000ms);
    assert(h.backend->realtime_connects == 7);   // first connect plus six retries
    assert(!h.repo->realtime().is_streaming());

    h.backend->refuse_realtime = false;
    h.repo->set_network_status(true);
    h.pump();
    assert(h.backend->realtime_connects == 8);
    assert(h.repo->realtime().is_streaming());
    assert(h.backend->last_transport() == transport);
    assert(transport->sent().size() == 2);   // subscribe sent again

    tether::change_event insert;
    insert.event_type = tether::change_event::type::insert;
    insert.row = make_record("remote-1", "Burpees", "U", h.timers->now());
    transport->simulate_change(insert);
    h.pump();
    assert(h.repo->list("U").size() == 1);

    // Online again while the endpoint still refuses: a fresh round of retries
    h.repo->set_network_status(false);
    h.backend->refuse_realtime = true;
    transport->simulate_drop();
    for (int i = 0; i < 120; ++i) h.advance(1000ms);
    assert(h.backend->realtime_connects == 14);

    h.repo->set_network_status(true);
    h.pump();
    assert(h.backend->realtime_connects == 15);
    assert(!h.repo->realtime().is_streaming());
    h.backend->refuse_realtime = false;
    h.advance(1000ms);
    assert(h.backend->realtime_connects == 16);
    assert(h.repo->realtime().is_streaming());

    std::cout << "  Change stream resume test passed!" << std::endl;
}

void test_initial_pull() {
    std::cout << "Testing initial pull..." << std::endl;

    harness::options opts;
    opts.owner = std::nullopt;
    opts.pull = true;
    harness h(opts);
    h.pump();
    assert(h.backend->requests.empty());

    auto now = h.timers->now();
    h.backend->rows["server-1"] = make_record("server-1", "Pull-ups", "U", now - 2000ms);
    h.backend->rows["server-2"] = make_record("server-2", "Dips", "U", now - 1000ms);
    h.backend->rows["server-v"] = make_record("server-v", "Theirs", "V", now);
    auto local = h.repo->create("Local only", "U");

    // Signing in fetches the owner's rows
    h.users->set_owner(std::string("U"));
    h.pump();
    assert(h.count_requests("GET") == 1);
    assert(h.backend->saw_text("owner_id=eq.U"));
    auto listed = h.repo->list("U");
    assert(listed.size() == 3);
    assert(listed[0].id == "server-1");
    assert(listed[1].id == "server-2");
    assert(listed[2].id == local.id);
    assert(h.repo->get_sync_status("server-1") == tether::sync_status::synced);
    assert(!h.repo->get("server-v").has_value());
    assert(h.repo->get_pending_operations().empty());

    // Explicit refresh picks up backend edits and deletions
    h.backend->rows["server-1"].name = "Strict pull-ups";
    h.backend->rows["server-1"].updated_at = now + 5000ms;
    h.backend->rows.erase("server-2");
    h.repo->refresh();
    h.pump();
    assert(h.count_requests("GET") == 2);
    assert(h.repo->get("server-1")->name == "Strict pull-ups");
    assert(!h.repo->get("server-2").has_value());
    assert(h.repo->get(local.id).has_value());

    // Offline: deferred until the network returns; unsent edits win
    h.repo->set_network_status(false);
    h.repo->update("server-1", rename_to("Weighted pull-ups"));
    h.repo->refresh();
    h.pump();
    assert(h.count_requests("GET") == 2);
    h.repo->set_network_status(true);
    h.pump();
    assert(h.count_requests("GET") == 3);
    assert(h.repo->get_pending_operations().empty());
    assert(h.repo->get("server-1")->name == "Weighted pull-ups");
    assert(h.backend->rows.at("server-1").name == "Weighted pull-ups");
    assert(h.repo->realtime().buffered_count() == 0);

    // A failed fetch is retried on the next reconnect
    h.backend->scripted_statuses = {503};
    h.repo->refresh();
    h.pump();
    assert(h.count_requests("GET") == 4);
    h.repo->set_network_status(false);
    h.repo->set_network_status(true);
    h.pump();
    assert(h.count_requests("GET") == 5);

    // Owner switch fetches for the new owner
    h.users->set_owner(std::string("V"));
    h.pump();
    assert(h.count_requests("GET") == 6);
    assert(h.backend->requests.back().url.find("owner_id=eq.V") != std::string::npos);
    assert(h.repo->get("server-v").has_value());
    assert(h.repo->list("V").size() == 1);
    assert(h.repo->list("U").size() == 2);

    std::cout << "  Initial pull test passed!" << std::endl;
}

void test_close_from_callback() {
    std::cout << "Testing close from a sync callback..." << std::endl;

    harness h;
    h.backend->deferred = true;
    int synced = 0;
    h.repo->set_on_operation_synced([&](const tether::sync_operation&) {
        synced++;
        h.repo.reset();
    });

    h.repo->create("Lunges", "U");
    h.repo->create("Rows", "U");
    h.pump();
    assert(h.backend->held.size() == 2);

    h.settle();
    assert(synced == 1);
    assert(!h.repo);
    assert(h.backend->rows.size() == 2);

    h.advance(60000ms);
    assert(h.timers->scheduled_count() == 0);
    assert(h.backend->requests.size() == 2);

    std::cout << "  Close from callback test passed!" << std::endl;
}

void test_restart_survival() {
    std::cout << "Testing restart survival..." << std::endl;

    harness::options opts;
    opts.online = false;
    opts.storage_path = temp_db_path("tether_restart_test.sqlite");
    harness h(opts);

    auto a = h.repo->create("Kettlebell", "U");
    auto b = h.repo->create("Rower", "U");
    h.repo->update(b.id, rename_to("Rowing machine"));
    h.repo->remove(a.id);
    h.pump();

    h.repo.reset();
    h.open(opts);

    auto listed = h.repo->list("U");
    assert(listed.size() == 1);
    assert(listed[0].id == b.id);
    assert(listed[0].name == "Rowing machine");
    assert(h.repo->get(a.id)->deleted);

    assert(h.repo->get_pending_operations().size() == 2);
    auto outstanding = h.repo->get_pending_operations();
    for (const auto& op : outstanding) {
        if (op.record_id == a.id) {
            assert(op.kind == tether::operation_kind::remove);
        } else {
            assert(op.record_id == b.id);
            assert(op.kind == tether::operation_kind::create);
            assert(op.payload.name == "Rowing machine");
        }
    }

    h.repo->set_network_status(true);
    h.pump();
    assert(h.repo->get_pending_operations().empty());
    assert(!h.repo->get(a.id).has_value());
    assert(h.repo->get_sync_status(b.id) == tether::sync_status::synced);
    assert(h.backend->rows.size() == 1);
    assert(h.backend->rows.at(b.id).name == "Rowing machine");

    h.repo.reset();
    temp_db_path("tether_restart_test.sqlite");
    std::cout << "  Restart survival test passed!" << std::endl;
}

void test_persistence_failure_rollback() {
    std::cout << "Testing rollback on persistence failure..." << std::endl;

    auto storage = std::make_shared<failing_store>();
    harness::options opts;
    opts.online = false;
    opts.storage = storage;
    harness h(opts);

    auto r = h.repo->create("Plank", "U");
    storage->fail_operations = true;

    assert(throws_db([&] { h.repo->create("Side plank", "U"); }));
    assert(h.repo->list("U").size() == 1);
    assert(h.repo->get_pending_operations().size() == 1);

    assert(throws_db([&] { h.repo->update(r.id, rename_to("Wall sit")); }));
    assert(h.repo->get(r.id)->name == "Plank");
    assert(h.repo->get_pending_operations().at(0).payload.name == "Plank");

    assert(throws_db([&] { h.repo->remove(r.id); }));
    assert(!h.repo->get(r.id)->deleted);
    assert(h.repo->get_pending_operations().at(0).kind == tether::operation_kind::create);

    storage->fail_operations = false;
    h.repo->set_network_status(true);
    h.pump();
    assert(h.backend->rows.at(r.id).name == "Plank");

    std::cout << "  Rollback test passed!" << std::endl;
}

void test_clear_all() {
    std::cout << "Testing clear_all..." << std::endl;

    harness::options opts;
    opts.online = false;
    harness h(opts);

    auto r = h.repo->create("Yoga", "U");
    h.repo->create("Pilates", "U");
    h.repo->clear_all();
    assert(h.repo->list("U").empty());
    assert(h.repo->get_pending_operations().empty());
    assert(!h.repo->get_sync_status(r.id).has_value());

    h.repo->set_network_status(true);
    h.pump();
    assert(h.backend->requests.empty());

    std::cout << "  clear_all test passed!" << std::endl;
}

int main() {
    std::cout << "=== TetherCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Value types
        test_timestamps();
        test_ids_and_trim();
        test_record_json();
        test_configuration();
        test_scheduler_dispatch();

        // Local state
        test_record_store();
        test_sync_queue_coalescing();
        test_sync_queue_persistence();

        // Remote
        test_remote_requests();
        test_change_stream_reconnect();

        // Repository
        test_create_offline_then_sync();
        test_create_update_delete_before_sync();
        test_coalescing_before_flush();
        test_sequential_updates_order();
        test_offline_durability();
        test_soft_delete_lifecycle();
        test_validation();
        test_subscribe();
        test_retry_backoff();
        test_recurring_retry();
        test_non_retryable_failures();
        test_session_scope();

        // Realtime
        test_realtime_protection();
        test_realtime_apply();
        test_deleted_record_stays_deleted();
        test_stream_resumes_when_online();
        test_initial_pull();

        // Persistence
        test_restart_survival();
        test_persistence_failure_rollback();
        test_clear_all();
        test_close_from_callback();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (31 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
