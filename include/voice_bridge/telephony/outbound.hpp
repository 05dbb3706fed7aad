#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/server/rest_server.hpp"

namespace voice_bridge {

struct OutboundCallRequest {
    std::string number;
    std::string prompt;
    std::string first_message;
};

// Throws ValidationError when the number is missing or a field has the wrong type.
OutboundCallRequest parse_outbound_call_request(const nlohmann::json& body);

std::string make_twiml_callback_url(const std::string& host,
                                    const std::string& prompt,
                                    const std::string& first_message);

std::string render_stream_twiml(const std::string& host,
                                const std::string& prompt,
                                const std::string& first_message);

// HTTP boundary for POST /outbound-call and the TwiML the provider fetches afterwards.
class OutboundCallInitiator {
public:
    using CallPlacer =
        std::function<std::string(const std::string& to, const std::string& callback_url)>;

    OutboundCallInitiator(std::optional<std::string> public_host, CallPlacer place_call);

    RestResponse handle_request(const nlohmann::json& body, const std::string& request_host) const;
    std::string twiml(const std::string& prompt,
                      const std::string& first_message,
                      const std::string& request_host) const;

private:
    std::string resolve_host(const std::string& request_host) const;

    std::optional<std::string> public_host_;
    CallPlacer place_call_;
};

}
