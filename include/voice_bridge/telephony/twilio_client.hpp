#pragma once

#include <chrono>
#include <string>

namespace voice_bridge {

// Places calls through the Twilio REST API.
class TwilioClient {
public:
    TwilioClient(std::string api_url,
                 std::string account_sid,
                 std::string auth_token,
                 std::string from_number,
                 std::chrono::milliseconds timeout);

    // Returns the SID of the created call.
    std::string create_call(const std::string& to_number, const std::string& callback_url) const;

private:
    std::string api_url_;
    std::string account_sid_;
    std::string auth_token_;
    std::string from_number_;
    std::chrono::milliseconds timeout_;
};

}
