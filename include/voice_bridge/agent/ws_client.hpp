#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "voice_bridge/agent/connection.hpp"

namespace voice_bridge {

// TLS WebSocket to a signed conversation URL, served by its own I/O thread.
class AgentWsClient : public AgentConnection {
public:
    explicit AgentWsClient(std::chrono::milliseconds open_timeout);
    ~AgentWsClient() override;

    void connect(const std::string& url, Handlers handlers) override;
    bool is_open() const override;
    void send_json(const nlohmann::json& payload) override;
    void close() override;

private:
    struct WsState;

    std::chrono::milliseconds open_timeout_;
    std::shared_ptr<WsState> ws_state_;
    std::thread worker_;
};

}
