#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace voice_bridge {

using SignedUrlProvider = std::function<std::string()>;

// Requests a single-use conversation URL for the configured agent.
class SignedUrlFetcher {
public:
    SignedUrlFetcher(std::string api_url,
                     std::string agent_id,
                     std::string api_key,
                     std::chrono::milliseconds timeout);

    std::string fetch() const;
    // Callable holding its own copy of the fetcher, for use on detached setup threads.
    SignedUrlProvider provider() const;

private:
    std::string api_url_;
    std::string agent_id_;
    std::string api_key_;
    std::chrono::milliseconds timeout_;
};

}
