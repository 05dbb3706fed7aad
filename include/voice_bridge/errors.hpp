#pragma once

#include <stdexcept>
#include <string>

namespace voice_bridge {

// Bad client input on an HTTP route; answered with 400.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& message) : std::runtime_error(message) {}
};

class UpstreamAuthError : public UpstreamError {
public:
    UpstreamAuthError(int status, const std::string& message)
        : UpstreamError(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class UpstreamUnavailableError : public UpstreamError {
public:
    explicit UpstreamUnavailableError(const std::string& message) : UpstreamError(message) {}
};

class MalformedResponseError : public UpstreamError {
public:
    explicit MalformedResponseError(const std::string& message) : UpstreamError(message) {}
};

class ProtocolDecodeError : public std::runtime_error {
public:
    explicit ProtocolDecodeError(const std::string& message) : std::runtime_error(message) {}
};

class ConnectionClosedError : public std::runtime_error {
public:
    explicit ConnectionClosedError(const std::string& message) : std::runtime_error(message) {}
};

}
