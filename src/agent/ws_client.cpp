#include "voice_bridge/agent/ws_client.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

#include <boost/asio/ssl.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

namespace {

using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = websocketpp::lib::asio::ssl::context;

constexpr long kCloseHandshakeTimeoutMs = 1000;

}

// Owned jointly by the client object and its I/O thread so late callbacks stay valid.
struct AgentWsClient::WsState {
    TlsClient client;
    websocketpp::connection_hdl connection;
    mutable std::mutex mutex;
    Handlers handlers;
    bool started = false;
    bool open = false;
    bool closing = false;
    bool close_reported = false;

    void report_close(const std::string& reason) {
        std::function<void(const std::string&)> on_close;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (close_reported) {
                return;
            }
            close_reported = true;
            open = false;
            on_close = std::move(handlers.on_close);
            handlers = Handlers{};
        }
        if (on_close) {
            on_close(reason);
        }
    }
};

AgentWsClient::AgentWsClient(std::chrono::milliseconds open_timeout)
    : open_timeout_(open_timeout),
      ws_state_(std::make_shared<WsState>()) {}

AgentWsClient::~AgentWsClient() {
    close();
    // The loop owns WsState and exits once the close handshake finishes;
    // never wait for it here, the caller may be a stream-server I/O thread.
    if (worker_.joinable()) {
        worker_.detach();
    }
}

void AgentWsClient::connect(const std::string& url, Handlers handlers) {
    if (url.rfind("wss://", 0) != 0) {
        throw std::invalid_argument("Agent URL must use wss://");
    }
    const auto host = utils::parse_url(url).host;

    auto state = ws_state_;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->started || state->closing) {
            return;
        }
        state->started = true;
        state->handlers = std::move(handlers);
    }

    WsState* raw = state.get();
    auto& client = state->client;
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();
    client.set_open_handshake_timeout(static_cast<long>(open_timeout_.count()));
    client.set_close_handshake_timeout(kCloseHandshakeTimeoutMs);

    client.set_tls_init_handler([host](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
        context->set_options(SslContext::default_workarounds | SslContext::no_sslv2 |
                             SslContext::no_sslv3 | SslContext::single_dh_use);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        context->set_verify_callback(boost::asio::ssl::host_name_verification(host));
        return context;
    });

    client.set_open_handler([raw](websocketpp::connection_hdl) {
        std::function<void()> on_open;
        {
            std::lock_guard<std::mutex> lock(raw->mutex);
            raw->open = true;
            on_open = raw->handlers.on_open;
        }
        if (on_open) {
            on_open();
        }
    });
    client.set_message_handler([raw](websocketpp::connection_hdl, TlsClient::message_ptr msg) {
        std::function<void(const std::string&)> on_message;
        {
            std::lock_guard<std::mutex> lock(raw->mutex);
            on_message = raw->handlers.on_message;
        }
        if (on_message) {
            on_message(msg->get_payload());
        }
    });
    client.set_close_handler([raw](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto conn = raw->client.get_con_from_hdl(hdl, ec);
        std::string reason = "closed";
        if (!ec) {
            reason += " code=" + std::to_string(conn->get_remote_close_code());
            if (!conn->get_remote_close_reason().empty()) {
                reason += " reason=" + conn->get_remote_close_reason();
            }
        }
        raw->report_close(reason);
    });
    client.set_fail_handler([raw](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto conn = raw->client.get_con_from_hdl(hdl, ec);
        raw->report_close(ec ? "failed" : "failed: " + conn->get_ec().message());
    });

    websocketpp::lib::error_code ec;
    auto conn = client.get_connection(url, ec);
    if (ec) {
        throw UpstreamUnavailableError("Agent connection refused: " + ec.message());
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->connection = conn->get_handle();
    }
    client.connect(conn);

    worker_ = std::thread([state]() {
        try {
            state->client.run();
        } catch (const std::exception& ex) {
            logging::error(
                "Agent connection loop failed",
                {kv("error", ex.what())});
            state->report_close(std::string("loop failed: ") + ex.what());
        }
    });
}

bool AgentWsClient::is_open() const {
    std::lock_guard<std::mutex> lock(ws_state_->mutex);
    return ws_state_->open && !ws_state_->closing;
}

void AgentWsClient::send_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(ws_state_->mutex);
    if (!ws_state_->open || ws_state_->closing) {
        throw ConnectionClosedError("Agent connection is not open");
    }
    websocketpp::lib::error_code ec;
    ws_state_->client.send(ws_state_->connection, payload.dump(),
                           websocketpp::frame::opcode::text, ec);
    if (ec) {
        throw ConnectionClosedError("Agent send failed: " + ec.message());
    }
}

void AgentWsClient::close() {
    std::lock_guard<std::mutex> lock(ws_state_->mutex);
    if (ws_state_->closing) {
        return;
    }
    ws_state_->closing = true;
    if (!ws_state_->started || ws_state_->connection.expired()) {
        return;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client.close(ws_state_->connection, websocketpp::close::status::going_away,
                            "session closed", ec);
    if (ec) {
        // Still connecting: there is no handshake to close, so stop the loop.
        logging::debug(
            "Agent close handshake skipped",
            {kv("error", ec.message())});
        ws_state_->client.stop();
    }
}

}
