#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {

// Client side of one conversational-AI WebSocket.
class AgentConnection {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_message;
        // Reported once, for a refused connect as well as for a close after open.
        std::function<void(const std::string&)> on_close;
    };

    virtual ~AgentConnection() = default;

    virtual void connect(const std::string& url, Handlers handlers) = 0;
    virtual bool is_open() const = 0;
    virtual void send_json(const nlohmann::json& payload) = 0;
    virtual void close() = 0;
};

using AgentConnectionFactory = std::function<std::unique_ptr<AgentConnection>()>;

}
