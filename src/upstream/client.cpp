#include "voice_bridge/upstream/client.hpp"

#include <stdexcept>
#include <utility>

#include "voice_bridge/logging.hpp"

namespace voice_bridge {

namespace {

constexpr size_t kBodySnippetLimit = 256;

std::pair<time_t, time_t> split_timeout(std::chrono::milliseconds timeout) {
    const auto sec = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto usec = std::chrono::duration_cast<std::chrono::microseconds>(timeout - sec);
    return {static_cast<time_t>(sec.count()), static_cast<time_t>(usec.count())};
}

}

UpstreamClient::UpstreamClient(std::string base_url, UpstreamRequestOptions options)
    : base_url_(std::move(base_url)),
      options_(options) {
    const auto url = utils::parse_url(base_url_);
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("Upstream URL must be http or https: " + base_url_);
    }
    base_path_ = url.path;
    // The universal client picks the TLS transport for https.
    client_ = std::make_unique<httplib::Client>(url.origin());
    apply_timeouts();
}

void UpstreamClient::set_header(const std::string& name, const std::string& value) {
    headers_.erase(name);
    headers_.emplace(name, value);
}

void UpstreamClient::set_basic_auth(const std::string& username, const std::string& password) {
    client_->set_basic_auth(username, password);
}

nlohmann::json UpstreamClient::get_json(const std::string& path, const std::string& query) {
    auto headers = headers_;
    headers.emplace("Accept", "application/json");
    auto full_path = build_path(path);
    if (!query.empty()) {
        full_path += "?" + query;
    }
    auto response = client_->Get(full_path, headers);
    return decode(response, path);
}

nlohmann::json UpstreamClient::post_form_json(const std::string& path,
                                              const utils::FormFields& fields) {
    auto headers = headers_;
    headers.emplace("Accept", "application/json");
    auto response = client_->Post(build_path(path), headers, utils::form_encode(fields),
                                  "application/x-www-form-urlencoded");
    return decode(response, path);
}

const std::string& UpstreamClient::base_url() const {
    return base_url_;
}

nlohmann::json UpstreamClient::decode(const httplib::Result& response,
                                      const std::string& path) const {
    if (!response) {
        throw UpstreamUnavailableError("Request to " + base_url_ + path + " failed: " +
                                       httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300) {
        logging::debug(
            "Upstream returned error status",
            {kv("url", base_url_ + path),
             kv("status", response->status),
             kv("response", response->body.substr(0, kBodySnippetLimit))});
        throw UpstreamAuthError(response->status,
                                "Request to " + base_url_ + path + " returned status " +
                                    std::to_string(response->status));
    }
    try {
        return nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::exception& ex) {
        throw MalformedResponseError("Response from " + base_url_ + path +
                                     " is not JSON: " + ex.what());
    }
}

std::string UpstreamClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

void UpstreamClient::apply_timeouts() {
    const auto connect = split_timeout(options_.connect_timeout);
    const auto read = split_timeout(options_.read_timeout);
    const auto write = split_timeout(options_.write_timeout);
    client_->set_connection_timeout(connect.first, connect.second);
    client_->set_read_timeout(read.first, read.second);
    client_->set_write_timeout(write.first, write.second);
}

}
