#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge::protocol {

// Messages of the ElevenLabs Conversational AI WebSocket.
enum class AgentMessageType {
    AgentResponse,
    UserTranscript,
    Audio,
    Interruption,
    Ping,
    Other
};

struct AgentMessage {
    AgentMessageType type = AgentMessageType::Other;
    std::string type_name;
    std::optional<std::string> text;
    std::optional<std::string> audio;
    std::optional<int64_t> event_id;
};

AgentMessage parse_agent_message(const std::string& frame);

nlohmann::json make_conversation_init(const std::string& prompt,
                                      const std::string& first_message);
nlohmann::json make_user_audio_chunk(const std::string& payload);
nlohmann::json make_pong(int64_t event_id);

}
