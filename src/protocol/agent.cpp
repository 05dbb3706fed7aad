#include "voice_bridge/protocol/agent.hpp"

#include "voice_bridge/errors.hpp"

namespace voice_bridge::protocol {

namespace {

std::optional<std::string> nested_string(const nlohmann::json& message,
                                         const char* object_key,
                                         const char* field_key) {
    const auto object = message.find(object_key);
    if (object == message.end() || !object->is_object()) {
        return std::nullopt;
    }
    const auto field = object->find(field_key);
    if (field == object->end() || !field->is_string()) {
        return std::nullopt;
    }
    return field->get<std::string>();
}

std::optional<int64_t> nested_int(const nlohmann::json& message,
                                  const char* object_key,
                                  const char* field_key) {
    const auto object = message.find(object_key);
    if (object == message.end() || !object->is_object()) {
        return std::nullopt;
    }
    const auto field = object->find(field_key);
    if (field == object->end() || !field->is_number_integer()) {
        return std::nullopt;
    }
    return field->get<int64_t>();
}

}

AgentMessage parse_agent_message(const std::string& frame) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ProtocolDecodeError(std::string("agent message is not JSON: ") + ex.what());
    }
    if (!message.is_object()) {
        throw ProtocolDecodeError("agent message is not an object");
    }

    AgentMessage result;
    const auto type = message.find("type");
    if (type != message.end() && type->is_string()) {
        result.type_name = type->get<std::string>();
    }

    if (result.type_name == "agent_response") {
        result.type = AgentMessageType::AgentResponse;
        result.text = nested_string(message, "agent_response_event", "agent_response");
    } else if (result.type_name == "user_transcript") {
        result.type = AgentMessageType::UserTranscript;
        result.text = nested_string(message, "user_transcription_event", "user_transcript");
    } else if (result.type_name == "audio") {
        result.type = AgentMessageType::Audio;
        // Older agents send audio.chunk, newer ones audio_event.audio_base_64.
        result.audio = nested_string(message, "audio", "chunk");
        if (!result.audio) {
            result.audio = nested_string(message, "audio_event", "audio_base_64");
        }
    } else if (result.type_name == "interruption") {
        result.type = AgentMessageType::Interruption;
    } else if (result.type_name == "ping") {
        result.type = AgentMessageType::Ping;
        result.event_id = nested_int(message, "ping_event", "event_id");
    }
    return result;
}

nlohmann::json make_conversation_init(const std::string& prompt,
                                      const std::string& first_message) {
    return {
        {"type", "conversation_initiation_client_data"},
        {"conversation_config_override",
         {{"agent",
           {{"prompt", {{"prompt", prompt}}},
            {"first_message", first_message}}}}},
    };
}

nlohmann::json make_user_audio_chunk(const std::string& payload) {
    return {{"user_audio_chunk", payload}};
}

nlohmann::json make_pong(int64_t event_id) {
    return {{"type", "pong"}, {"event_id", event_id}};
}

}
