#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/agent/signed_url.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/server/stream_server.hpp"
#include "voice_bridge/session/media_bridge.hpp"
#include "voice_bridge/session/registry.hpp"
#include "voice_bridge/telephony/outbound.hpp"
#include "voice_bridge/telephony/twilio_client.hpp"

namespace voice_bridge {

class VoiceBridgeApp {
public:
    explicit VoiceBridgeApp(Config config);
    ~VoiceBridgeApp();

    void init();
    void run();
    void stop();
    // Safe to call from a signal handler.
    void request_stop();
    const Config& config() const;

private:
    std::shared_ptr<MediaBridge> create_bridge(std::shared_ptr<Channel> telephony);

    Config config_;
    ObserverRegistry registry_;
    SignedUrlFetcher signed_url_fetcher_;
    TwilioClient twilio_client_;
    OutboundCallInitiator outbound_;
    std::unique_ptr<RestServer> rest_server_;
    std::unique_ptr<StreamServer> stream_server_;
    std::atomic<bool> quitting_{false};
    bool stopped_ = false;
};

}
