#pragma once

#include <string>
#include <utility>
#include <vector>

namespace voice_bridge::utils {

using FormFields = std::vector<std::pair<std::string, std::string>>;

struct Url {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;

    bool secure() const { return scheme == "https" || scheme == "wss"; }
    // scheme://host:port, without the path.
    std::string origin() const;
};

// Throws std::invalid_argument when the host is missing or the port is not a number.
Url parse_url(const std::string& url);

std::string url_encode(const std::string& value);

// application/x-www-form-urlencoded body, fields kept in the given order.
std::string form_encode(const FormFields& fields);

}
