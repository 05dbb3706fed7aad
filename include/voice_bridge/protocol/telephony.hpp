#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge::protocol {

// Frames of the Twilio Media Streams WebSocket protocol.
enum class TelephonyEventType {
    Connected,
    Start,
    Media,
    Stop,
    Mark,
    Dtmf,
    Unknown
};

struct StreamStart {
    std::string stream_sid;
    std::string call_sid;
    std::map<std::string, std::string> custom_parameters;
};

struct TelephonyEvent {
    TelephonyEventType type = TelephonyEventType::Unknown;
    std::string name;
    std::optional<StreamStart> start;
    std::string media_payload;
};

// Throws ProtocolDecodeError when the frame is not JSON or a known event lacks its fields.
TelephonyEvent parse_telephony_event(const std::string& frame);

// Decodes and re-encodes a base64 audio payload; throws ProtocolDecodeError on bad input.
std::string reencode_audio_payload(const std::string& payload);

nlohmann::json make_media_frame(const std::string& stream_sid, const std::string& payload);
nlohmann::json make_clear_frame(const std::string& stream_sid);

}
