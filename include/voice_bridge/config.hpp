#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voice_bridge {

struct Config {
    std::string elevenlabs_api_key;
    std::string elevenlabs_agent_id;
    std::string elevenlabs_api_url = "https://api.elevenlabs.io";
    std::string twilio_account_sid;
    std::string twilio_auth_token;
    std::string twilio_phone_number;
    std::string twilio_api_url = "https://api.twilio.com";
    int http_port = 8000;
    int stream_port = 8001;
    int stream_threads = 2;
    std::optional<std::string> public_host;
    double ai_setup_timeout_sec = 10.0;
    double twilio_request_timeout_sec = 30.0;
    std::string default_prompt = "you are gary from the phone store";
    std::string default_first_message = "Hey, how can I help you today?";
    std::vector<std::string> cors_allowed_origins;
    std::optional<std::string> authorization_token;
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_bridge";

    static Config load();
    void validate() const;
};

}
