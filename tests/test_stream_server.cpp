#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/stream_server.hpp"
#include "voice_bridge/session/media_bridge.hpp"
#include "voice_bridge/session/registry.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

using namespace voice_bridge;
using json = nlohmann::json;

namespace {

using PlainClient = websocketpp::client<websocketpp::config::asio_client>;

bool wait_until(const std::function<bool()>& done) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return done();
}

// Plain ws:// client playing the telephony provider or an observer.
class StreamClient {
public:
    StreamClient() {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        client_.start_perpetual();
        thread_ = std::thread([this]() { client_.run(); });
    }

    ~StreamClient() {
        client_.stop_perpetual();
        client_.stop();
        thread_.join();
    }

    void connect(const std::string& uri) {
        websocketpp::lib::error_code ec;
        auto conn = client_.get_connection(uri, ec);
        REQUIRE_FALSE(ec);
        conn->set_open_handler([this](websocketpp::connection_hdl) { opened_ = true; });
        conn->set_fail_handler([this](websocketpp::connection_hdl hdl) {
            websocketpp::lib::error_code error;
            auto failed = client_.get_con_from_hdl(hdl, error);
            failure_status_ = error ? -1 : static_cast<int>(failed->get_response_code());
        });
        conn->set_close_handler([this](websocketpp::connection_hdl) { closed_ = true; });
        handle_ = conn->get_handle();
        client_.connect(conn);
    }

    void send(const std::string& payload) {
        client_.send(handle_, payload, websocketpp::frame::opcode::text);
    }

    void close() {
        websocketpp::lib::error_code ec;
        client_.close(handle_, websocketpp::close::status::normal, "done", ec);
    }

    bool opened() const { return opened_; }
    bool closed() const { return closed_; }
    int failure_status() const { return failure_status_; }

private:
    PlainClient client_;
    std::thread thread_;
    websocketpp::connection_hdl handle_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> closed_{false};
    std::atomic<int> failure_status_{0};
};

struct ServerFixture {
    Config config;
    ObserverRegistry registry;
    std::mutex mutex;
    std::vector<std::shared_ptr<MediaBridge>> bridges;
    std::unique_ptr<StreamServer> server;

    ServerFixture() {
        config.stream_port = 0;
        config.stream_threads = 1;
        server = std::make_unique<StreamServer>(
            config, registry, [this](std::shared_ptr<Channel> telephony) {
                auto bridge = std::make_shared<MediaBridge>(
                    std::move(telephony),
                    registry,
                    []() { return std::string("wss://agent.example/convai"); },
                    []() {
                        return std::unique_ptr<AgentConnection>(
                            std::make_unique<testing::FakeAgentConnection>());
                    },
                    [](std::function<void()> task) { task(); },
                    MediaBridge::Options{"prompt", "greeting"});
                std::lock_guard<std::mutex> lock(mutex);
                bridges.push_back(bridge);
                return bridge;
            });
        server->start();
    }

    ~ServerFixture() {
        server->stop();
    }

    std::string uri(const std::string& path) const {
        return "ws://127.0.0.1:" + std::to_string(server->port()) + path;
    }

    std::shared_ptr<MediaBridge> bridge(size_t index) {
        std::lock_guard<std::mutex> lock(mutex);
        return index < bridges.size() ? bridges[index] : nullptr;
    }
};

}

TEST_CASE("stream server binds an ephemeral port") {
    ServerFixture fixture;
    REQUIRE(fixture.server->port() != 0);
}

TEST_CASE("observer disconnect removes its registry entry") {
    ServerFixture fixture;
    StreamClient observer;
    observer.connect(fixture.uri("/transcription-stream/CA1"));

    REQUIRE(wait_until([&]() { return fixture.registry.size() == 1; }));
    REQUIRE(fixture.registry.lookup("CA1") != nullptr);

    observer.close();

    REQUIRE(wait_until([&]() { return fixture.registry.size() == 0; }));
    REQUIRE_FALSE(fixture.registry.send("CA1", json{{"event", "transcript"}}));
}

TEST_CASE("closing a replaced observer keeps its successor registered") {
    ServerFixture fixture;
    StreamClient first;
    StreamClient second;
    first.connect(fixture.uri("/transcription-stream/CA1"));
    REQUIRE(wait_until([&]() { return fixture.registry.size() == 1; }));
    const auto first_channel = fixture.registry.lookup("CA1");

    second.connect(fixture.uri("/transcription-stream/CA1"));
    REQUIRE(wait_until([&]() { return fixture.registry.lookup("CA1") != first_channel; }));

    first.close();
    REQUIRE(wait_until([&]() { return first.closed(); }));

    REQUIRE(fixture.registry.size() == 1);
    REQUIRE(fixture.registry.lookup("CA1") != first_channel);
}

TEST_CASE("telephony hangup closes its bridge") {
    ServerFixture fixture;
    StreamClient telephony;
    telephony.connect(fixture.uri("/outbound-media-stream"));
    REQUIRE(wait_until([&]() { return telephony.opened(); }));
    REQUIRE(wait_until([&]() { return fixture.bridge(0) != nullptr; }));

    telephony.send(
        R"({"event":"start","start":{"streamSid":"ST1","callSid":"CA1","customParameters":{}}})");
    REQUIRE(wait_until([&]() { return fixture.bridge(0)->call_sid().has_value(); }));

    telephony.close();

    REQUIRE(wait_until(
        [&]() { return fixture.bridge(0)->state() == MediaBridge::State::Closed; }));
}

TEST_CASE("unknown stream paths are refused with 404") {
    ServerFixture fixture;
    StreamClient client;
    client.connect(fixture.uri("/not-a-stream"));

    REQUIRE(wait_until([&]() { return client.failure_status() != 0; }));
    REQUIRE(client.failure_status() == 404);
    REQUIRE_FALSE(client.opened());
    REQUIRE(fixture.registry.size() == 0);
}
