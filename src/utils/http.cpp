#include "voice_bridge/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_bridge::utils {

namespace {

int parse_port(const std::string& text, const std::string& url) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        throw std::invalid_argument("Invalid port in URL: " + url);
    }
    const int port = std::stoi(text);
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("Invalid port in URL: " + url);
    }
    return port;
}

}

std::string Url::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Url parse_url(const std::string& url) {
    Url result;
    std::string rest = url;

    const auto separator = rest.find("://");
    if (separator == std::string::npos) {
        result.scheme = "http";
    } else {
        result.scheme = rest.substr(0, separator);
        std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        rest.erase(0, separator + 3);
    }

    // Path keeps the query string; the host part ends at the first '/' or '?'.
    const auto authority_end = rest.find_first_of("/?");
    const auto authority = rest.substr(0, authority_end);
    if (authority_end != std::string::npos) {
        result.path = rest.substr(authority_end);
    }

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        result.host = authority;
        result.port = result.secure() ? 443 : 80;
    } else {
        result.host = authority.substr(0, colon);
        result.port = parse_port(authority.substr(colon + 1), url);
    }
    if (result.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return result;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string form_encode(const FormFields& fields) {
    std::string body;
    for (const auto& field : fields) {
        if (!body.empty()) {
            body += '&';
        }
        body += url_encode(field.first);
        body += '=';
        body += url_encode(field.second);
    }
    return body;
}

}
