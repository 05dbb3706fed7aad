#pragma once

#include <chrono>
#include <string>
#include <thread>

#include <httplib.h>

namespace voice_bridge::testing {

// Loopback HTTP server standing in for a provider API; routes are added before start().
class LocalServer {
public:
    httplib::Server& server() { return server_; }

    void start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~LocalServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

}
