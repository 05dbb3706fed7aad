#include "voice_bridge/server/stream_server.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;
using Handle = websocketpp::connection_hdl;

class WsChannel : public Channel {
public:
    WsChannel(WsServer& server, Handle handle)
        : server_(server), handle_(std::move(handle)) {}

    bool is_open() const override {
        websocketpp::lib::error_code ec;
        auto conn = server_.get_con_from_hdl(handle_, ec);
        return !ec && conn->get_state() == websocketpp::session::state::open;
    }

    void send_text(const std::string& payload) override {
        websocketpp::lib::error_code ec;
        server_.send(handle_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw ConnectionClosedError(ec.message());
        }
    }

    void close(const std::string& reason) override {
        websocketpp::lib::error_code ec;
        server_.close(handle_, websocketpp::close::status::normal, reason, ec);
        if (ec) {
            logging::debug(
                "WebSocket close skipped",
                {kv("error", ec.message())});
        }
    }

private:
    WsServer& server_;
    Handle handle_;
};

struct ObserverEntry {
    std::string call_sid;
    std::shared_ptr<Channel> channel;
};

std::string strip_query(const std::string& resource) {
    const auto pos = resource.find('?');
    return pos == std::string::npos ? resource : resource.substr(0, pos);
}

}

std::optional<StreamTarget> resolve_stream_target(const std::string& resource) {
    const auto path = strip_query(resource);
    if (path == kMediaStreamPath) {
        return StreamTarget{StreamRoute::MediaStream, ""};
    }
    const std::string prefix(kTranscriptionStreamPrefix);
    if (path.rfind(prefix, 0) == 0) {
        const auto call_sid = path.substr(prefix.size());
        if (!call_sid.empty() && call_sid.find('/') == std::string::npos) {
            return StreamTarget{StreamRoute::Observer, call_sid};
        }
    }
    return std::nullopt;
}

struct StreamServer::ServerState {
    WsServer server;
    std::mutex mutex;
    std::map<Handle, std::shared_ptr<MediaBridge>, std::owner_less<Handle>> bridges;
    std::map<Handle, ObserverEntry, std::owner_less<Handle>> observers;
    std::vector<std::thread> threads;
    bool running = false;
};

StreamServer::StreamServer(const Config& config,
                           ObserverRegistry& registry,
                           BridgeFactory make_bridge)
    : config_(config),
      registry_(registry),
      make_bridge_(std::move(make_bridge)),
      server_state_(std::make_unique<ServerState>()) {}

StreamServer::~StreamServer() {
    stop();
}

void StreamServer::start() {
    auto* state = server_state_.get();
    auto& server = state->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([state](Handle hdl) {
        auto conn = state->server.get_con_from_hdl(hdl);
        if (!resolve_stream_target(conn->get_resource())) {
            logging::warn(
                "WebSocket upgrade rejected",
                {kv("resource", conn->get_resource())});
            conn->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    });

    server.set_open_handler([this, state](Handle hdl) {
        auto conn = state->server.get_con_from_hdl(hdl);
        const auto target = resolve_stream_target(conn->get_resource());
        if (!target) {
            return;
        }
        auto channel = std::make_shared<WsChannel>(state->server, hdl);
        if (target->route == StreamRoute::MediaStream) {
            logging::info(
                "Telephony connected to media stream",
                {kv("remote", conn->get_remote_endpoint())});
            auto bridge = make_bridge_(channel);
            std::lock_guard<std::mutex> lock(state->mutex);
            state->bridges[hdl] = std::move(bridge);
            return;
        }
        logging::info(
            "Observer connected",
            {kv("call_sid", target->call_sid)});
        registry_.register_observer(target->call_sid, channel);
        std::lock_guard<std::mutex> lock(state->mutex);
        state->observers[hdl] = ObserverEntry{target->call_sid, channel};
    });

    server.set_message_handler([state](Handle hdl, WsServer::message_ptr msg) {
        std::shared_ptr<MediaBridge> bridge;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            const auto it = state->bridges.find(hdl);
            if (it != state->bridges.end()) {
                bridge = it->second;
            }
        }
        if (bridge) {
            bridge->handle_telephony_message(msg->get_payload());
        }
    });

    auto on_disconnect = [this, state](Handle hdl) {
        std::shared_ptr<MediaBridge> bridge;
        std::optional<ObserverEntry> observer;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            const auto bridge_it = state->bridges.find(hdl);
            if (bridge_it != state->bridges.end()) {
                bridge = std::move(bridge_it->second);
                state->bridges.erase(bridge_it);
            }
            const auto observer_it = state->observers.find(hdl);
            if (observer_it != state->observers.end()) {
                observer = std::move(observer_it->second);
                state->observers.erase(observer_it);
            }
        }
        if (bridge) {
            logging::info(
                "Telephony stream closed",
                {kv("call_sid", bridge->call_sid())});
            bridge->handle_telephony_closed();
        }
        if (observer) {
            logging::info(
                "Observer disconnected",
                {kv("call_sid", observer->call_sid)});
            registry_.unregister(observer->call_sid, observer->channel.get());
        }
    };
    server.set_close_handler(on_disconnect);
    server.set_fail_handler(on_disconnect);

    server.listen(static_cast<uint16_t>(config_.stream_port));
    server.start_accept();
    state->running = true;

    for (int i = 0; i < config_.stream_threads; ++i) {
        state->threads.emplace_back([state]() {
            try {
                state->server.run();
            } catch (const std::exception& ex) {
                logging::error(
                    "Stream server loop failed",
                    {kv("error", ex.what())});
            }
        });
    }
    logging::info(
        "Stream server listening",
        {kv("port", port()),
         kv("threads", config_.stream_threads)});
}

uint16_t StreamServer::port() const {
    websocketpp::lib::asio::error_code ec;
    const auto endpoint = server_state_->server.get_local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void StreamServer::stop() {
    auto* state = server_state_.get();
    if (!state || !state->running) {
        return;
    }
    state->running = false;

    websocketpp::lib::error_code ec;
    state->server.stop_listening(ec);

    std::vector<std::shared_ptr<MediaBridge>> bridges;
    std::vector<std::shared_ptr<Channel>> observers;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        for (auto& item : state->bridges) {
            bridges.push_back(item.second);
        }
        for (auto& item : state->observers) {
            observers.push_back(item.second.channel);
        }
    }
    for (auto& bridge : bridges) {
        bridge->close("server shutdown");
    }
    for (auto& observer : observers) {
        observer->close("server shutdown");
    }

    state->server.stop();
    for (auto& thread : state->threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    state->threads.clear();
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->bridges.clear();
        state->observers.clear();
    }
}

}
