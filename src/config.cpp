#include "voice_bridge/config.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "voice_bridge/utils/text.hpp"

namespace voice_bridge {

namespace {

constexpr int kMaxPort = 65535;

// Lookups over the process environment; empty values count as unset.
struct Env {
    static std::optional<std::string> get(const char* name) {
        const char* value = std::getenv(name);
        if (!value || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    static std::string get_or(const char* name, const std::string& fallback) {
        return get(name).value_or(fallback);
    }

    static std::string require(const char* name) {
        auto value = get(name);
        if (!value) {
            throw std::runtime_error(std::string(name) + " is required");
        }
        return *value;
    }

    template <typename T>
    static T number(const char* name, T fallback) {
        const auto value = get(name);
        if (!value) {
            return fallback;
        }
        std::istringstream stream(*value);
        T parsed{};
        if (!(stream >> parsed) || !(stream >> std::ws).eof()) {
            throw std::runtime_error(std::string(name) + " must be a number, got '" +
                                     *value + "'");
        }
        return parsed;
    }
};

std::vector<std::string> split_csv(const std::string& raw) {
    std::vector<std::string> result;
    std::istringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = utils::trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string with_timestamp(const std::filesystem::path& file) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream stamped;
    stamped << file.stem().string() << '_' << std::put_time(&local, "%Y%m%d_%H%M%S")
            << file.extension().string();
    return stamped.str();
}

// KEY=VALUE, optionally prefixed with "export" and with the value quoted.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(std::string line) {
    line = utils::trim(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }
    if (line.rfind("export ", 0) == 0) {
        line = utils::trim(line.substr(7));
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
        return std::nullopt;
    }
    auto key = utils::trim(line.substr(0, eq));
    auto value = utils::trim(line.substr(eq + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(std::move(key), std::move(value));
}

// Variables already set in the process environment take precedence.
void load_dotenv() {
    std::ifstream stream(std::filesystem::current_path() / ".env");
    if (!stream.is_open()) {
        return;
    }
    std::string line;
    while (std::getline(stream, line)) {
        if (const auto entry = parse_dotenv_line(line)) {
            setenv(entry->first.c_str(), entry->second.c_str(), 0);
        }
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.elevenlabs_api_key = Env::require("ELEVENLABS_API_KEY");
    config.elevenlabs_agent_id = Env::require("ELEVENLABS_AGENT_ID");
    config.elevenlabs_api_url = Env::get_or("ELEVENLABS_API_URL", config.elevenlabs_api_url);
    config.twilio_account_sid = Env::require("TWILIO_ACCOUNT_SID");
    config.twilio_auth_token = Env::require("TWILIO_AUTH_TOKEN");
    config.twilio_phone_number = Env::require("TWILIO_PHONE_NUMBER");
    config.twilio_api_url = Env::get_or("TWILIO_API_URL", config.twilio_api_url);

    config.http_port = Env::number("PORT", config.http_port);
    config.stream_port = Env::number("STREAM_PORT", config.stream_port);
    config.stream_threads = Env::number("STREAM_THREADS", config.stream_threads);
    config.public_host = Env::get("PUBLIC_HOST");
    config.ai_setup_timeout_sec =
        Env::number("AI_SETUP_TIMEOUT_SEC", config.ai_setup_timeout_sec);
    config.twilio_request_timeout_sec =
        Env::number("TWILIO_REQUEST_TIMEOUT_SEC", config.twilio_request_timeout_sec);

    config.default_prompt = Env::get_or("DEFAULT_PROMPT", config.default_prompt);
    config.default_first_message =
        Env::get_or("DEFAULT_FIRST_MESSAGE", config.default_first_message);
    config.cors_allowed_origins =
        split_csv(Env::get_or("CORS_ALLOWED_ORIGINS", "http://localhost:3000"));
    config.authorization_token = Env::get("AUTHORIZATION_TOKEN");

    config.log_level = Env::get_or("LOG_LEVEL", config.log_level);
    config.log_name = Env::get_or("LOG_NAME", config.log_name);
    if (const auto log_filename = Env::get("LOG_FILENAME")) {
        const auto stamped = with_timestamp(*log_filename);
        config.logs_dir = Env::get("LOGS_DIR");
        config.log_filename =
            config.logs_dir ? (*config.logs_dir / stamped).string() : stamped;
    }

    return config;
}

void Config::validate() const {
    if (elevenlabs_api_key.empty()) {
        throw std::runtime_error("ELEVENLABS_API_KEY is required");
    }
    if (elevenlabs_agent_id.empty()) {
        throw std::runtime_error("ELEVENLABS_AGENT_ID is required");
    }
    if (twilio_account_sid.empty()) {
        throw std::runtime_error("TWILIO_ACCOUNT_SID is required");
    }
    if (twilio_auth_token.empty()) {
        throw std::runtime_error("TWILIO_AUTH_TOKEN is required");
    }
    if (twilio_phone_number.empty()) {
        throw std::runtime_error("TWILIO_PHONE_NUMBER is required");
    }
    if (http_port <= 0 || http_port > kMaxPort) {
        throw std::runtime_error("PORT must be between 1 and 65535");
    }
    if (stream_port <= 0 || stream_port > kMaxPort) {
        throw std::runtime_error("STREAM_PORT must be between 1 and 65535");
    }
    if (stream_port == http_port) {
        throw std::runtime_error("STREAM_PORT must differ from PORT");
    }
    if (stream_threads <= 0) {
        throw std::runtime_error("STREAM_THREADS must be positive");
    }
    if (ai_setup_timeout_sec <= 0.0) {
        throw std::runtime_error("AI_SETUP_TIMEOUT_SEC must be positive");
    }
    if (twilio_request_timeout_sec <= 0.0) {
        throw std::runtime_error("TWILIO_REQUEST_TIMEOUT_SEC must be positive");
    }
}

}
