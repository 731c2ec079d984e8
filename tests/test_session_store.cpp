#include <catch2/catch_test_macros.hpp>
#include "session/session_store.hpp"

#include <chrono>
#include <format>
#include <thread>
#include <vector>

using namespace sqlrag;

namespace {

Turn make_turn(const std::string& text) {
    Turn t;
    t.query.text = text;
    t.response.statement = "SELECT 1";
    return t;
}

} // anonymous namespace

TEST_CASE("SessionStore: window returns the newest turns oldest first", "[session]") {
    SessionStore store;
    for (int i = 1; i <= 5; ++i) {
        store.append("s1", make_turn(std::format("q{}", i)));
    }

    const auto w = store.window("s1", 3);
    REQUIRE(w.size() == 3);
    CHECK(w[0].query.text == "q3");
    CHECK(w[2].query.text == "q5");

    CHECK(store.window("s1", 10).size() == 5);
    CHECK(store.window("unknown", 3).empty());

    const auto last = store.last_turn("s1");
    REQUIRE(last.has_value());
    CHECK(last->query.text == "q5");
}

TEST_CASE("SessionStore: history is bounded", "[session]") {
    SessionStore store(SessionStore::Config{.max_history = 3});
    for (int i = 1; i <= 5; ++i) {
        store.append("s1", make_turn(std::format("q{}", i)));
    }

    const auto h = store.history("s1");
    REQUIRE(h.size() == 3);
    CHECK(h.front().query.text == "q3");
}

TEST_CASE("SessionStore: sessions are isolated", "[session]") {
    SessionStore store;
    store.append("alice", make_turn("how many patients"));
    store.append("bob", make_turn("list departments"));

    CHECK(store.session_count() == 2);
    CHECK(store.history("alice").size() == 1);
    CHECK(store.history("alice")[0].query.text == "how many patients");

    store.clear("alice");
    CHECK(store.history("alice").empty());
    CHECK(store.history("bob").size() == 1);
}

TEST_CASE("SessionStore: idle sessions are swept", "[session]") {
    SessionStore store(SessionStore::Config{.max_history = 10, .idle_timeout = std::chrono::seconds{0}});
    store.append("s1", make_turn("q"));
    std::this_thread::sleep_for(std::chrono::milliseconds{5});

    CHECK(store.sweep_expired() == 1);
    CHECK(store.session_count() == 0);
}

TEST_CASE("SessionStore: oldest session evicted at capacity", "[session]") {
    SessionStore store(SessionStore::Config{.max_history = 10, .idle_timeout = std::chrono::seconds{1800},
                                            .max_sessions = 2});
    store.append("first", make_turn("q"));
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    store.append("second", make_turn("q"));
    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    store.append("third", make_turn("q"));

    CHECK(store.session_count() == 2);
    CHECK(store.history("first").empty());
    CHECK(store.history("third").size() == 1);
}

TEST_CASE("SessionStore: concurrent appends to one session", "[session]") {
    SessionStore store(SessionStore::Config{.max_history = 1000});
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store] {
            for (int i = 0; i < 50; ++i) store.append("shared", make_turn("q"));
        });
    }
    for (auto& t : threads) t.join();

    CHECK(store.history("shared").size() == 200);
}
