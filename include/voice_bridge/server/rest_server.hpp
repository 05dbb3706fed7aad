#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_bridge/config.hpp"

namespace voice_bridge {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    using OutboundCallHandler =
        std::function<RestResponse(const nlohmann::json& body, const std::string& host)>;
    using TwimlHandler = std::function<std::string(const std::string& prompt,
                                                   const std::string& first_message,
                                                   const std::string& host)>;

    RestServer(const Config& config, OutboundCallHandler on_outbound_call, TwimlHandler on_twiml);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void apply_cors(const httplib::Request& request, httplib::Response& response) const;
    void handle_twiml(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    OutboundCallHandler on_outbound_call_;
    TwimlHandler on_twiml_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

// Request body as JSON: form-encoded fields become string members.
nlohmann::json request_body_json(const httplib::Request& request);

}
