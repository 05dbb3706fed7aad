#include "voice_bridge/telephony/twilio_client.hpp"

#include <utility>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/upstream/client.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

TwilioClient::TwilioClient(std::string api_url,
                           std::string account_sid,
                           std::string auth_token,
                           std::string from_number,
                           std::chrono::milliseconds timeout)
    : api_url_(std::move(api_url)),
      account_sid_(std::move(account_sid)),
      auth_token_(std::move(auth_token)),
      from_number_(std::move(from_number)),
      timeout_(timeout) {}

std::string TwilioClient::create_call(const std::string& to_number,
                                      const std::string& callback_url) const {
    UpstreamClient client(api_url_, {timeout_, timeout_, timeout_});
    client.set_basic_auth(account_sid_, auth_token_);

    const auto path = "/2010-04-01/Accounts/" + utils::url_encode(account_sid_) + "/Calls.json";
    const auto started = std::chrono::steady_clock::now();
    const auto response = client.post_form_json(path, {{"To", to_number},
                                                       {"From", from_number_},
                                                       {"Url", callback_url}});
    Metrics::instance().observe_upstream_time(
        "create_call",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    const auto it = response.find("sid");
    if (!response.is_object() || it == response.end() || !it->is_string()) {
        throw MalformedResponseError("sid missing from call creation response");
    }
    const auto call_sid = it->get<std::string>();
    logging::info(
        "Outbound call created",
        {kv("call_sid", call_sid),
         kv("to", to_number)});
    return call_sid;
}

}
