#include "voice_bridge/protocol/telephony.hpp"

#include <cctype>

#include <websocketpp/base64/base64.hpp>

#include "voice_bridge/errors.hpp"

namespace voice_bridge::protocol {

namespace {

TelephonyEventType event_type(const std::string& name) {
    if (name == "start") return TelephonyEventType::Start;
    if (name == "media") return TelephonyEventType::Media;
    if (name == "stop") return TelephonyEventType::Stop;
    if (name == "connected") return TelephonyEventType::Connected;
    if (name == "mark") return TelephonyEventType::Mark;
    if (name == "dtmf") return TelephonyEventType::Dtmf;
    return TelephonyEventType::Unknown;
}

std::string required_string(const nlohmann::json& object, const char* key, const char* context) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw ProtocolDecodeError(std::string(context) + "." + key + " is missing");
    }
    return it->get<std::string>();
}

StreamStart parse_start(const nlohmann::json& message) {
    const auto it = message.find("start");
    if (it == message.end() || !it->is_object()) {
        throw ProtocolDecodeError("start event has no start object");
    }
    StreamStart start;
    start.stream_sid = required_string(*it, "streamSid", "start");
    start.call_sid = required_string(*it, "callSid", "start");
    const auto params = it->find("customParameters");
    if (params != it->end() && params->is_object()) {
        for (auto param = params->begin(); param != params->end(); ++param) {
            start.custom_parameters[param.key()] =
                param.value().is_string() ? param.value().get<std::string>()
                                          : param.value().dump();
        }
    }
    return start;
}

bool is_base64_char(unsigned char ch) {
    return std::isalnum(ch) || ch == '+' || ch == '/';
}

}

TelephonyEvent parse_telephony_event(const std::string& frame) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ProtocolDecodeError(std::string("telephony frame is not JSON: ") + ex.what());
    }
    if (!message.is_object()) {
        throw ProtocolDecodeError("telephony frame is not an object");
    }

    TelephonyEvent event;
    event.name = message.value("event", "");
    event.type = event_type(event.name);
    switch (event.type) {
    case TelephonyEventType::Start:
        event.start = parse_start(message);
        break;
    case TelephonyEventType::Media: {
        const auto media = message.find("media");
        if (media == message.end() || !media->is_object()) {
            throw ProtocolDecodeError("media event has no media object");
        }
        event.media_payload = required_string(*media, "payload", "media");
        break;
    }
    default:
        break;
    }
    return event;
}

std::string reencode_audio_payload(const std::string& payload) {
    size_t padding = 0;
    for (const char ch : payload) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !is_base64_char(byte)) {
            throw ProtocolDecodeError("audio payload is not base64");
        }
    }
    if (padding > 2) {
        throw ProtocolDecodeError("audio payload is not base64");
    }
    return websocketpp::base64_encode(websocketpp::base64_decode(payload));
}

nlohmann::json make_media_frame(const std::string& stream_sid, const std::string& payload) {
    return {
        {"event", "media"},
        {"streamSid", stream_sid},
        {"media", {{"payload", payload}}},
    };
}

nlohmann::json make_clear_frame(const std::string& stream_sid) {
    return {
        {"event", "clear"},
        {"streamSid", stream_sid},
    };
}

}
