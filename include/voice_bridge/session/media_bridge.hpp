#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/agent/connection.hpp"
#include "voice_bridge/agent/signed_url.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/protocol/telephony.hpp"
#include "voice_bridge/session/channel.hpp"
#include "voice_bridge/session/registry.hpp"

namespace voice_bridge {

// Relays one telephony media stream to one conversational-AI connection and
// mirrors transcripts and agent audio to the call's observer, if any.
//
// Telephony frames arrive on the stream server's thread for this connection,
// agent messages on the agent client's thread; each side is handled in order.
class MediaBridge : public std::enable_shared_from_this<MediaBridge> {
public:
    enum class State {
        AwaitingStart,
        AiConnecting,
        Active,
        Closing,
        Closed
    };

    using TaskRunner = std::function<void(std::function<void()>)>;

    struct Options {
        std::string default_prompt;
        std::string default_first_message;
    };

    MediaBridge(std::shared_ptr<Channel> telephony,
                ObserverRegistry& registry,
                SignedUrlProvider signed_url,
                AgentConnectionFactory agent_factory,
                TaskRunner run_task,
                Options options);
    ~MediaBridge();

    MediaBridge(const MediaBridge&) = delete;
    MediaBridge& operator=(const MediaBridge&) = delete;

    void handle_telephony_message(const std::string& frame);
    void handle_telephony_closed();
    void close(const std::string& reason);

    State state() const;
    std::optional<std::string> call_sid() const;
    std::optional<std::string> stream_sid() const;
    std::map<std::string, std::string> session_parameters() const;

private:
    void on_stream_start(const protocol::StreamStart& start);
    void connect_agent();
    void on_agent_open();
    void on_agent_message(const std::string& frame);
    void on_agent_closed(const std::string& reason);
    void forward_user_audio(const std::string& payload);
    void send_to_telephony(const nlohmann::json& frame);
    void send_to_observer(const std::optional<std::string>& call_sid,
                          const nlohmann::json& event);
    std::string session_parameter(const std::string& key, const std::string& fallback) const;
    logging::Fields log_fields() const;

    std::shared_ptr<Channel> telephony_;
    ObserverRegistry& registry_;
    SignedUrlProvider signed_url_;
    AgentConnectionFactory agent_factory_;
    TaskRunner run_task_;
    Options options_;

    mutable std::mutex mutex_;
    State state_ = State::AwaitingStart;
    std::optional<std::string> call_sid_;
    std::optional<std::string> stream_sid_;
    std::map<std::string, std::string> parameters_;
    std::shared_ptr<AgentConnection> agent_;
};

const char* to_string(MediaBridge::State state);

}
