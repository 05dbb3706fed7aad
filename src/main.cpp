#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <csignal>
#include <string>

namespace {

voice_bridge::VoiceBridgeApp* g_app = nullptr;

void handle_signal(int) {
    if (g_app) {
        g_app->request_stop();
    }
}

}

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("http_port", config.http_port),
             voice_bridge::kv("stream_port", config.stream_port),
             voice_bridge::kv("agent_id", config.elevenlabs_agent_id),
             voice_bridge::kv("public_host", config.public_host)});
        voice_bridge::VoiceBridgeApp app(config);
        g_app = &app;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        app.init();
        app.run();
        g_app = nullptr;
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
