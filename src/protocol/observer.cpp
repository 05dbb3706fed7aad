#include "voice_bridge/protocol/observer.hpp"

namespace voice_bridge::protocol {

const char* to_string(Speaker speaker) {
    return speaker == Speaker::Agent ? "Agent" : "User";
}

nlohmann::json make_transcript_event(Speaker speaker, const std::string& text) {
    return {
        {"event", "transcript"},
        {"speaker", to_string(speaker)},
        {"text", text},
    };
}

}
