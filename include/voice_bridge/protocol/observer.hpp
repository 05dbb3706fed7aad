#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge::protocol {

enum class Speaker {
    Agent,
    User
};

const char* to_string(Speaker speaker);

nlohmann::json make_transcript_event(Speaker speaker, const std::string& text);

}
