#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

struct UpstreamRequestOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{10000};
    std::chrono::milliseconds write_timeout{10000};
};

// JSON-over-HTTP(S) client for the telephony and AI providers.
// Transport failures raise UpstreamUnavailableError, non-2xx statuses
// UpstreamAuthError, and undecodable bodies MalformedResponseError.
class UpstreamClient {
public:
    UpstreamClient(std::string base_url, UpstreamRequestOptions options);

    void set_header(const std::string& name, const std::string& value);
    void set_basic_auth(const std::string& username, const std::string& password);

    nlohmann::json get_json(const std::string& path, const std::string& query = "");
    nlohmann::json post_form_json(const std::string& path, const utils::FormFields& fields);

    const std::string& base_url() const;

private:
    std::string build_path(const std::string& path) const;
    nlohmann::json decode(const httplib::Result& response, const std::string& path) const;
    void apply_timeouts();

    std::string base_url_;
    std::string base_path_;
    UpstreamRequestOptions options_;
    httplib::Headers headers_;
    std::unique_ptr<httplib::Client> client_;
};

}
