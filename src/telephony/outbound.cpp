#include "voice_bridge/telephony/outbound.hpp"

#include <sstream>
#include <utility>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/server/stream_server.hpp"
#include "voice_bridge/utils/http.hpp"
#include "voice_bridge/utils/text.hpp"

namespace voice_bridge {

namespace {

std::string optional_string(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

RestResponse failure(int status, const std::string& message) {
    return {status, {{"success", false}, {"error", message}}};
}

}

OutboundCallRequest parse_outbound_call_request(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be an object");
    }
    OutboundCallRequest request;
    request.number = utils::trim(optional_string(body, "number"));
    if (request.number.empty()) {
        throw ValidationError("Phone number is required");
    }
    request.prompt = optional_string(body, "prompt");
    request.first_message = optional_string(body, "first_message");
    return request;
}

std::string make_twiml_callback_url(const std::string& host,
                                    const std::string& prompt,
                                    const std::string& first_message) {
    return "https://" + host + "/outbound-call-twiml?prompt=" + utils::url_encode(prompt) +
           "&first_message=" + utils::url_encode(first_message);
}

std::string render_stream_twiml(const std::string& host,
                                const std::string& prompt,
                                const std::string& first_message) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<Response>\n"
        << "  <Connect>\n"
        << "    <Stream url=\"wss://" << utils::xml_escape(host) << kMediaStreamPath << "\">\n"
        << "      <Parameter name=\"prompt\" value=\"" << utils::xml_escape(prompt) << "\" />\n"
        << "      <Parameter name=\"first_message\" value=\""
        << utils::xml_escape(first_message) << "\" />\n"
        << "    </Stream>\n"
        << "  </Connect>\n"
        << "</Response>\n";
    return out.str();
}

OutboundCallInitiator::OutboundCallInitiator(std::optional<std::string> public_host,
                                             CallPlacer place_call)
    : public_host_(std::move(public_host)),
      place_call_(std::move(place_call)) {}

RestResponse OutboundCallInitiator::handle_request(const nlohmann::json& body,
                                                   const std::string& request_host) const {
    OutboundCallRequest request;
    std::string host;
    try {
        request = parse_outbound_call_request(body);
        host = resolve_host(request_host);
    } catch (const ValidationError& ex) {
        logging::warn(
            "Outbound call rejected",
            {kv("error", ex.what())});
        return failure(400, ex.what());
    }

    try {
        const auto callback_url =
            make_twiml_callback_url(host, request.prompt, request.first_message);
        logging::info(
            "Initiating outbound call",
            {kv("to", request.number),
             kv("callback_host", host)});
        const auto call_sid = place_call_(request.number, callback_url);
        Metrics::instance().count_outbound_call(true);
        return {200,
                {{"success", true},
                 {"message", "Call initiated"},
                 {"callSid", call_sid}}};
    } catch (const std::exception& ex) {
        Metrics::instance().count_outbound_call(false);
        logging::error(
            "Error initiating outbound call",
            {kv("to", request.number),
             kv("error", ex.what())});
        return failure(500, "Failed to initiate call");
    }
}

std::string OutboundCallInitiator::twiml(const std::string& prompt,
                                         const std::string& first_message,
                                         const std::string& request_host) const {
    return render_stream_twiml(resolve_host(request_host), prompt, first_message);
}

std::string OutboundCallInitiator::resolve_host(const std::string& request_host) const {
    if (public_host_) {
        return *public_host_;
    }
    if (request_host.empty()) {
        throw ValidationError("Host header is required");
    }
    return request_host;
}

}
