#include "voice_bridge/session/media_bridge.hpp"

#include <exception>
#include <utility>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/protocol/agent.hpp"
#include "voice_bridge/protocol/observer.hpp"

namespace voice_bridge {

namespace {

constexpr const char* kToAgent = "telephony_to_agent";
constexpr const char* kToTelephony = "agent_to_telephony";
constexpr const char* kDropped = "dropped";

}

const char* to_string(MediaBridge::State state) {
    switch (state) {
    case MediaBridge::State::AwaitingStart:
        return "awaiting_start";
    case MediaBridge::State::AiConnecting:
        return "ai_connecting";
    case MediaBridge::State::Active:
        return "active";
    case MediaBridge::State::Closing:
        return "closing";
    case MediaBridge::State::Closed:
        return "closed";
    }
    return "unknown";
}

MediaBridge::MediaBridge(std::shared_ptr<Channel> telephony,
                         ObserverRegistry& registry,
                         SignedUrlProvider signed_url,
                         AgentConnectionFactory agent_factory,
                         TaskRunner run_task,
                         Options options)
    : telephony_(std::move(telephony)),
      registry_(registry),
      signed_url_(std::move(signed_url)),
      agent_factory_(std::move(agent_factory)),
      run_task_(std::move(run_task)),
      options_(std::move(options)) {
    Metrics::instance().session_started();
}

MediaBridge::~MediaBridge() {
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = state_ == State::Closed;
    }
    if (!finished) {
        close("session released");
    }
}

void MediaBridge::handle_telephony_message(const std::string& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closing || state_ == State::Closed) {
            return;
        }
    }
    try {
        const auto event = protocol::parse_telephony_event(frame);
        switch (event.type) {
        case protocol::TelephonyEventType::Start:
            on_stream_start(*event.start);
            break;
        case protocol::TelephonyEventType::Media:
            forward_user_audio(event.media_payload);
            break;
        case protocol::TelephonyEventType::Stop:
            logging::log(spdlog::level::info, "Telephony stream stopped", log_fields());
            close("telephony stop");
            break;
        default:
            logging::log(spdlog::level::debug, "Telephony event ignored", log_fields(),
                         {kv("event", event.name)});
            break;
        }
    } catch (const ProtocolDecodeError& ex) {
        logging::log(spdlog::level::warn, "Malformed telephony frame", log_fields(),
                     {kv("error", ex.what())});
    } catch (const std::exception& ex) {
        logging::log(spdlog::level::err, "Telephony frame handling failed", log_fields(),
                     {kv("error", ex.what())});
    }
}

void MediaBridge::handle_telephony_closed() {
    close("telephony closed");
}

void MediaBridge::close(const std::string& reason) {
    std::shared_ptr<AgentConnection> agent;
    State previous = State::AwaitingStart;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closing || state_ == State::Closed) {
            return;
        }
        previous = state_;
        state_ = State::Closing;
        agent = agent_;
    }
    logging::log(spdlog::level::info, "Closing session", log_fields(),
                 {kv("reason", reason),
                  kv("previous_state", to_string(previous))});

    if (agent) {
        agent->close();
    }
    if (telephony_ && telephony_->is_open()) {
        telephony_->close(reason);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Closed;
    }
    Metrics::instance().session_finished();
    logging::log(spdlog::level::info, "Session closed", log_fields());
}

MediaBridge::State MediaBridge::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::string> MediaBridge::call_sid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return call_sid_;
}

std::optional<std::string> MediaBridge::stream_sid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_sid_;
}

std::map<std::string, std::string> MediaBridge::session_parameters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parameters_;
}

void MediaBridge::on_stream_start(const protocol::StreamStart& start) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::AwaitingStart) {
            // Identifiers are fixed by the first start event.
            logging::warn(
                "Duplicate start event ignored",
                {kv("call_sid", call_sid_),
                 kv("stream_sid", stream_sid_),
                 kv("state", to_string(state_))});
            return;
        }
        call_sid_ = start.call_sid;
        stream_sid_ = start.stream_sid;
        parameters_ = start.custom_parameters;
        state_ = State::AiConnecting;
    }
    logging::log(spdlog::level::info, "Stream started", log_fields(),
                 {kv("parameters", start.custom_parameters.size())});

    auto self = shared_from_this();
    run_task_([self]() { self->connect_agent(); });
}

void MediaBridge::connect_agent() {
    std::shared_ptr<AgentConnection> agent;
    try {
        const auto url = signed_url_();
        agent = std::shared_ptr<AgentConnection>(agent_factory_());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::AiConnecting) {
                return;
            }
            agent_ = agent;
        }

        std::weak_ptr<MediaBridge> weak = shared_from_this();
        AgentConnection::Handlers handlers;
        handlers.on_open = [weak]() {
            if (auto self = weak.lock()) {
                self->on_agent_open();
            }
        };
        handlers.on_message = [weak](const std::string& frame) {
            if (auto self = weak.lock()) {
                self->on_agent_message(frame);
            }
        };
        handlers.on_close = [weak](const std::string& reason) {
            if (auto self = weak.lock()) {
                self->on_agent_closed(reason);
            }
        };
        agent->connect(url, std::move(handlers));
    } catch (const UpstreamError& ex) {
        logging::log(spdlog::level::err, "Agent session setup failed", log_fields(),
                     {kv("error", ex.what())});
        close("agent setup failed");
    } catch (const std::exception& ex) {
        logging::log(spdlog::level::err, "Agent connection failed", log_fields(),
                     {kv("error", ex.what())});
        close("agent connection failed");
    }
}

void MediaBridge::on_agent_open() {
    std::shared_ptr<AgentConnection> agent;
    bool connecting = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agent = agent_;
        connecting = state_ == State::AiConnecting;
    }
    if (!agent) {
        return;
    }
    if (!connecting) {
        agent->close();
        return;
    }

    const auto prompt = session_parameter("prompt", options_.default_prompt);
    const auto first_message =
        session_parameter("first_message", options_.default_first_message);
    try {
        agent->send_json(protocol::make_conversation_init(prompt, first_message));
    } catch (const ConnectionClosedError& ex) {
        logging::log(spdlog::level::warn, "Agent closed before initialization", log_fields(),
                     {kv("error", ex.what())});
        close("agent closed");
        return;
    }

    // Media is only forwarded once Active, so the init message is always first.
    bool activated = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::AiConnecting) {
            state_ = State::Active;
            activated = true;
        }
    }
    if (activated) {
        logging::log(spdlog::level::info, "Agent connected", log_fields());
    }
}

void MediaBridge::on_agent_message(const std::string& frame) {
    std::optional<std::string> call_sid;
    std::optional<std::string> stream_sid;
    std::shared_ptr<AgentConnection> agent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Closing || state_ == State::Closed) {
            return;
        }
        call_sid = call_sid_;
        stream_sid = stream_sid_;
        agent = agent_;
    }

    try {
        const auto message = protocol::parse_agent_message(frame);
        switch (message.type) {
        case protocol::AgentMessageType::AgentResponse:
            if (message.text) {
                send_to_observer(call_sid, protocol::make_transcript_event(
                                               protocol::Speaker::Agent, *message.text));
            }
            break;
        case protocol::AgentMessageType::UserTranscript:
            if (message.text) {
                send_to_observer(call_sid, protocol::make_transcript_event(
                                               protocol::Speaker::User, *message.text));
            }
            break;
        case protocol::AgentMessageType::Audio: {
            if (!message.audio) {
                logging::log(spdlog::level::debug, "Agent audio without payload", log_fields());
                break;
            }
            if (!stream_sid) {
                Metrics::instance().count_frame(kDropped);
                logging::log(spdlog::level::info, "Agent audio dropped, no stream sid yet",
                             log_fields());
                break;
            }
            const auto media = protocol::make_media_frame(*stream_sid, *message.audio);
            send_to_telephony(media);
            Metrics::instance().count_frame(kToTelephony);
            send_to_observer(call_sid, media);
            break;
        }
        case protocol::AgentMessageType::Interruption:
            if (stream_sid) {
                const auto clear = protocol::make_clear_frame(*stream_sid);
                send_to_telephony(clear);
                send_to_observer(call_sid, clear);
            }
            break;
        case protocol::AgentMessageType::Ping:
            if (message.event_id && agent) {
                agent->send_json(protocol::make_pong(*message.event_id));
            }
            break;
        case protocol::AgentMessageType::Other:
            logging::log(spdlog::level::debug, "Unhandled agent message", log_fields(),
                         {kv("type", message.type_name)});
            break;
        }
    } catch (const ProtocolDecodeError& ex) {
        logging::log(spdlog::level::warn, "Malformed agent message", log_fields(),
                     {kv("error", ex.what())});
    } catch (const std::exception& ex) {
        logging::log(spdlog::level::err, "Agent message handling failed", log_fields(),
                     {kv("error", ex.what())});
    }
}

void MediaBridge::on_agent_closed(const std::string& reason) {
    logging::log(spdlog::level::info, "Agent disconnected", log_fields(),
                 {kv("reason", reason)});
    close("agent closed");
}

void MediaBridge::forward_user_audio(const std::string& payload) {
    std::shared_ptr<AgentConnection> agent;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Active) {
            agent = agent_;
        }
    }
    // No buffering: audio that arrives before the agent is ready is stale.
    if (!agent || !agent->is_open()) {
        Metrics::instance().count_frame(kDropped);
        return;
    }
    try {
        agent->send_json(protocol::make_user_audio_chunk(
            protocol::reencode_audio_payload(payload)));
        Metrics::instance().count_frame(kToAgent);
    } catch (const ConnectionClosedError& ex) {
        Metrics::instance().count_frame(kDropped);
        logging::log(spdlog::level::debug, "User audio not delivered", log_fields(),
                     {kv("error", ex.what())});
    }
}

void MediaBridge::send_to_telephony(const nlohmann::json& frame) {
    if (!telephony_) {
        return;
    }
    try {
        telephony_->send_text(frame.dump());
    } catch (const ConnectionClosedError& ex) {
        logging::log(spdlog::level::debug, "Telephony frame not delivered", log_fields(),
                     {kv("error", ex.what())});
    }
}

void MediaBridge::send_to_observer(const std::optional<std::string>& call_sid,
                                   const nlohmann::json& event) {
    if (!call_sid) {
        return;
    }
    registry_.send(*call_sid, event);
}

std::string MediaBridge::session_parameter(const std::string& key,
                                           const std::string& fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = parameters_.find(key);
    if (it == parameters_.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

logging::Fields MediaBridge::log_fields() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {kv("call_sid", call_sid_), kv("stream_sid", stream_sid_)};
}

}
