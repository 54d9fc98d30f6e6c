#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "session_store.hpp"
#include <format>

using namespace tmxu;

TEST_CASE("Store starts with an empty snapshot", "[store]") {
    FakeSessionDataProvider provider;
    SessionStore store(&provider);
    auto snapshot = store.get_snapshot();
    REQUIRE(snapshot);
    REQUIRE(snapshot->sessions.empty());
    REQUIRE(provider.query_count == 0);
}

TEST_CASE("Refresh swaps snapshots", "[store]") {
    FakeSessionDataProvider provider;
    provider.output = kSampleOutput;
    SessionStore store(&provider);

    auto before = store.get_snapshot();
    auto result = store.refresh();
    REQUIRE(result.success);

    auto after = store.get_snapshot();
    REQUIRE(after != before);
    REQUIRE(after->sessions.size() == 2);
    REQUIRE(after->find_session("scratch") != nullptr);
    REQUIRE(after->find_session("missing") == nullptr);

    // Readers holding the old snapshot keep it intact
    REQUIRE(before->sessions.empty());
}

TEST_CASE("Failed refresh keeps the previous snapshot", "[store]") {
    FakeSessionDataProvider provider;
    provider.output = kSampleOutput;
    SessionStore store(&provider);
    REQUIRE(store.refresh().success);
    auto good = store.get_snapshot();

    provider.error = "tmux error: lost server";
    auto result = store.refresh();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_message == "tmux error: lost server");
    REQUIRE(store.get_snapshot() == good);

    auto errors = store.get_recent_errors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].message == "tmux error: lost server");

    store.clear_errors();
    REQUIRE(store.get_recent_errors().empty());
}

TEST_CASE("Error list is bounded", "[store]") {
    FakeSessionDataProvider provider;
    SessionStore store(&provider);
    for (int i = 0; i < 15; ++i) {
        store.record_error(std::format("error {}", i));
    }

    auto errors = store.get_recent_errors();
    REQUIRE(errors.size() == 10);
    REQUIRE(errors.front().message == "error 5");
    REQUIRE(errors.back().message == "error 14");
}
