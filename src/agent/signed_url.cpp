#include "voice_bridge/agent/signed_url.hpp"

#include <utility>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/upstream/client.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

namespace {

constexpr const char* kSignedUrlPath = "/v1/convai/conversation/get_signed_url";

}

SignedUrlFetcher::SignedUrlFetcher(std::string api_url,
                                   std::string agent_id,
                                   std::string api_key,
                                   std::chrono::milliseconds timeout)
    : api_url_(std::move(api_url)),
      agent_id_(std::move(agent_id)),
      api_key_(std::move(api_key)),
      timeout_(timeout) {}

std::string SignedUrlFetcher::fetch() const {
    UpstreamClient client(api_url_, {timeout_, timeout_, timeout_});
    client.set_header("xi-api-key", api_key_);

    const auto started = std::chrono::steady_clock::now();
    const auto response = client.get_json(kSignedUrlPath,
                                          "agent_id=" + utils::url_encode(agent_id_));
    Metrics::instance().observe_upstream_time(
        "signed_url",
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    const auto it = response.find("signed_url");
    if (!response.is_object() || it == response.end() || !it->is_string() ||
        it->get_ref<const std::string&>().empty()) {
        throw MalformedResponseError("signed_url missing from response");
    }
    logging::debug(
        "Signed URL received",
        {kv("agent_id", agent_id_)});
    return it->get<std::string>();
}

SignedUrlProvider SignedUrlFetcher::provider() const {
    return [fetcher = *this]() { return fetcher.fetch(); };
}

}
