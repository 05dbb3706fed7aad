#pragma once

#include <string>

namespace voice_bridge {

// Server side of an accepted WebSocket: the telephony media stream or an observer.
class Channel {
public:
    virtual ~Channel() = default;

    virtual bool is_open() const = 0;
    // Throws ConnectionClosedError when the peer is gone.
    virtual void send_text(const std::string& payload) = 0;
    virtual void close(const std::string& reason) = 0;
};

}
