#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "voice_bridge/config.hpp"
#include "voice_bridge/session/channel.hpp"
#include "voice_bridge/session/media_bridge.hpp"
#include "voice_bridge/session/registry.hpp"

namespace voice_bridge {

constexpr const char* kMediaStreamPath = "/outbound-media-stream";
constexpr const char* kTranscriptionStreamPrefix = "/transcription-stream/";

enum class StreamRoute {
    MediaStream,
    Observer
};

struct StreamTarget {
    StreamRoute route;
    std::string call_sid;
};

// Maps a WebSocket request resource onto an endpoint; nullopt means 404.
std::optional<StreamTarget> resolve_stream_target(const std::string& resource);

// Hosts the telephony media-stream and observer WebSocket endpoints.
class StreamServer {
public:
    using BridgeFactory = std::function<std::shared_ptr<MediaBridge>(std::shared_ptr<Channel>)>;

    StreamServer(const Config& config, ObserverRegistry& registry, BridgeFactory make_bridge);
    ~StreamServer();

    void start();
    void stop();
    // Bound port once started; differs from the configured one when that was 0.
    uint16_t port() const;

private:
    struct ServerState;

    const Config& config_;
    ObserverRegistry& registry_;
    BridgeFactory make_bridge_;
    std::unique_ptr<ServerState> server_state_;
};

}
