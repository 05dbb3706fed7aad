#include <catch2/catch_test_macros.hpp>

#include "local_server.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/server/rest_server.hpp"
#include "voice_bridge/telephony/outbound.hpp"
#include "voice_bridge/telephony/twilio_client.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace voice_bridge;
using json = nlohmann::json;

namespace {

struct RecordingPlacer {
    std::string to;
    std::string callback_url;
    int calls = 0;

    OutboundCallInitiator::CallPlacer placer() {
        return [this](const std::string& number, const std::string& url) {
            ++calls;
            to = number;
            callback_url = url;
            return std::string("CA777");
        };
    }
};

}

TEST_CASE("outbound call request requires a phone number") {
    REQUIRE_THROWS_AS(parse_outbound_call_request(json::object()), ValidationError);
    REQUIRE_THROWS_AS(parse_outbound_call_request(json{{"number", "   "}}), ValidationError);
    REQUIRE_THROWS_AS(parse_outbound_call_request(json{{"number", 15551234}}), ValidationError);
    REQUIRE_THROWS_AS(parse_outbound_call_request(json::array()), ValidationError);

    const auto request = parse_outbound_call_request(
        json{{"number", " +15551234567 "}, {"prompt", "be kind"}});
    REQUIRE(request.number == "+15551234567");
    REQUIRE(request.prompt == "be kind");
    REQUIRE(request.first_message.empty());
}

TEST_CASE("callback url encodes prompt and first message") {
    REQUIRE(make_twiml_callback_url("bridge.example", "you are gary", "Hi & bye") ==
            "https://bridge.example/outbound-call-twiml?prompt=you%20are%20gary"
            "&first_message=Hi%20%26%20bye");
}

TEST_CASE("stream twiml points at the media stream and escapes values") {
    const auto twiml = render_stream_twiml("bridge.example", "say \"hi\"", "<b>&</b>");
    REQUIRE(twiml.find("<Stream url=\"wss://bridge.example/outbound-media-stream\">") !=
            std::string::npos);
    REQUIRE(twiml.find("<Parameter name=\"prompt\" value=\"say &quot;hi&quot;\" />") !=
            std::string::npos);
    REQUIRE(twiml.find("value=\"&lt;b&gt;&amp;&lt;/b&gt;\"") != std::string::npos);
    REQUIRE(twiml.rfind("<?xml", 0) == 0);
}

TEST_CASE("successful outbound call returns the call sid") {
    RecordingPlacer recorder;
    OutboundCallInitiator initiator(std::nullopt, recorder.placer());

    const auto response = initiator.handle_request(
        json{{"number", "+15551234567"}, {"prompt", "p"}, {"first_message", "f"}},
        "bridge.example");

    REQUIRE(response.status == 200);
    REQUIRE(response.body == json{{"success", true},
                                  {"message", "Call initiated"},
                                  {"callSid", "CA777"}});
    REQUIRE(recorder.to == "+15551234567");
    REQUIRE(recorder.callback_url ==
            "https://bridge.example/outbound-call-twiml?prompt=p&first_message=f");
}

TEST_CASE("missing number is a client error and no call is placed") {
    RecordingPlacer recorder;
    OutboundCallInitiator initiator(std::nullopt, recorder.placer());

    const auto response = initiator.handle_request(json{{"prompt", "p"}}, "bridge.example");

    REQUIRE(response.status == 400);
    REQUIRE(response.body["success"] == false);
    REQUIRE(response.body["error"] == "Phone number is required");
    REQUIRE(recorder.calls == 0);
}

TEST_CASE("provider failure is reported generically") {
    OutboundCallInitiator initiator(std::nullopt, [](const std::string&, const std::string&)
                                                      -> std::string {
        throw UpstreamAuthError(401, "Authenticate");
    });

    const auto response = initiator.handle_request(json{{"number", "+1555"}}, "bridge.example");

    REQUIRE(response.status == 500);
    REQUIRE(response.body == json{{"success", false}, {"error", "Failed to initiate call"}});
}

TEST_CASE("public host overrides the request host") {
    RecordingPlacer recorder;
    OutboundCallInitiator initiator(std::string("public.example"), recorder.placer());

    initiator.handle_request(json{{"number", "+1555"}}, "internal:8000");
    REQUIRE(recorder.callback_url.rfind("https://public.example/", 0) == 0);

    const auto twiml = initiator.twiml("p", "f", "");
    REQUIRE(twiml.find("wss://public.example/outbound-media-stream") != std::string::npos);
}

TEST_CASE("missing host header without public host is rejected") {
    RecordingPlacer recorder;
    OutboundCallInitiator initiator(std::nullopt, recorder.placer());

    REQUIRE(initiator.handle_request(json{{"number", "+1555"}}, "").status == 400);
    REQUIRE_THROWS_AS(initiator.twiml("p", "f", ""), ValidationError);
}

TEST_CASE("form and JSON bodies decode to the same fields") {
    httplib::Request form;
    form.headers.emplace("Content-Type", "application/x-www-form-urlencoded");
    form.params.emplace("number", "+15551234567");
    form.params.emplace("prompt", "hi there");
    REQUIRE(request_body_json(form) == json{{"number", "+15551234567"}, {"prompt", "hi there"}});

    httplib::Request body;
    body.headers.emplace("Content-Type", "application/json");
    body.body = R"({"number":"+15551234567","prompt":"hi there"})";
    REQUIRE(request_body_json(body) == request_body_json(form));

    httplib::Request empty;
    REQUIRE(request_body_json(empty) == json::object());

    httplib::Request broken;
    broken.body = "{not json";
    REQUIRE_THROWS(request_body_json(broken));
}

TEST_CASE("twilio client posts the call form with basic auth") {
    testing::LocalServer local;
    std::string auth;
    std::string to;
    std::string from;
    std::string url;
    local.server().Post("/2010-04-01/Accounts/AC123/Calls.json",
                        [&](const httplib::Request& req, httplib::Response& res) {
                            auth = req.get_header_value("Authorization");
                            to = req.get_param_value("To");
                            from = req.get_param_value("From");
                            url = req.get_param_value("Url");
                            res.status = 201;
                            res.set_content(R"({"sid":"CA900","status":"queued"})",
                                            "application/json");
                        });
    local.start();

    TwilioClient client(local.url(), "AC123", "secret", "+15550000000",
                        std::chrono::milliseconds(2000));
    const auto sid = client.create_call("+15551234567", "https://host/outbound-call-twiml?prompt=a");

    REQUIRE(sid == "CA900");
    REQUIRE(auth == "Basic QUMxMjM6c2VjcmV0");
    REQUIRE(to == "+15551234567");
    REQUIRE(from == "+15550000000");
    REQUIRE(url == "https://host/outbound-call-twiml?prompt=a");
}

TEST_CASE("twilio client surfaces rejected credentials") {
    testing::LocalServer local;
    local.server().Post("/2010-04-01/Accounts/AC123/Calls.json",
                        [](const httplib::Request&, httplib::Response& res) {
                            res.status = 401;
                            res.set_content(R"({"code":20003,"message":"Authenticate"})",
                                            "application/json");
                        });
    local.start();

    TwilioClient client(local.url(), "AC123", "wrong", "+15550000000",
                        std::chrono::milliseconds(2000));
    REQUIRE_THROWS_AS(client.create_call("+15551234567", "https://host/x"), UpstreamAuthError);
}
