#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/session/registry.hpp"

#include <memory>

#include <nlohmann/json.hpp>

using voice_bridge::ObserverRegistry;
using voice_bridge::testing::FakeChannel;
using json = nlohmann::json;

TEST_CASE("registered observer receives events for its call") {
    ObserverRegistry registry;
    auto observer = std::make_shared<FakeChannel>();
    registry.register_observer("CA1", observer);

    REQUIRE(registry.send("CA1", json{{"event", "transcript"}, {"text", "hi"}}));
    REQUIRE(observer->sent_json().size() == 1);
    REQUIRE(registry.lookup("CA1") == observer);
}

TEST_CASE("sending to an unknown call is a no-op") {
    ObserverRegistry registry;
    REQUIRE_FALSE(registry.send("CA-missing", json{{"event", "transcript"}}));
    REQUIRE(registry.lookup("CA-missing") == nullptr);
}

TEST_CASE("registering again replaces the previous observer") {
    ObserverRegistry registry;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();
    registry.register_observer("CA1", first);
    registry.register_observer("CA1", second);

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.send("CA1", json{{"event", "clear"}}));
    REQUIRE(first->sent_json().empty());
    REQUIRE(second->sent_json().size() == 1);
}

TEST_CASE("unregister is idempotent") {
    ObserverRegistry registry;
    registry.register_observer("CA1", std::make_shared<FakeChannel>());
    registry.unregister("CA1");
    registry.unregister("CA1");
    REQUIRE(registry.size() == 0);
}

TEST_CASE("a replaced observer closing does not remove its successor") {
    ObserverRegistry registry;
    auto first = std::make_shared<FakeChannel>();
    auto second = std::make_shared<FakeChannel>();
    registry.register_observer("CA1", first);
    registry.register_observer("CA1", second);

    REQUIRE_FALSE(registry.unregister("CA1", first.get()));
    REQUIRE(registry.lookup("CA1") == second);
    REQUIRE(registry.unregister("CA1", second.get()));
    REQUIRE(registry.size() == 0);
}

TEST_CASE("closed observers are skipped") {
    ObserverRegistry registry;
    auto observer = std::make_shared<FakeChannel>();
    registry.register_observer("CA1", observer);
    observer->set_open(false);

    REQUIRE_FALSE(registry.send("CA1", json{{"event", "transcript"}}));
    REQUIRE(observer->sent_json().empty());
}

TEST_CASE("observers for different calls are independent") {
    ObserverRegistry registry;
    auto one = std::make_shared<FakeChannel>();
    auto two = std::make_shared<FakeChannel>();
    registry.register_observer("CA1", one);
    registry.register_observer("CA2", two);

    registry.send("CA2", json{{"event", "transcript"}, {"text", "two"}});

    REQUIRE(one->sent_json().empty());
    REQUIRE(two->sent_json().front()["text"] == "two");
}
