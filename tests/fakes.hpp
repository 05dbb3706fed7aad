#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/agent/connection.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/session/channel.hpp"

namespace voice_bridge::testing {

class FakeChannel : public Channel {
public:
    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    void send_text(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw ConnectionClosedError("channel closed");
        }
        sent_.push_back(payload);
    }

    void close(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        close_reason_ = reason;
        ++close_calls_;
    }

    void set_open(bool open) {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = open;
    }

    std::vector<nlohmann::json> sent_json() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> frames;
        for (const auto& payload : sent_) {
            frames.push_back(nlohmann::json::parse(payload));
        }
        return frames;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

private:
    mutable std::mutex mutex_;
    bool open_ = true;
    std::vector<std::string> sent_;
    std::string close_reason_;
    int close_calls_ = 0;
};

// Agent side driven by the test: open(), deliver() and drop() stand in for the network.
class FakeAgentConnection : public AgentConnection {
public:
    void connect(const std::string& url, Handlers handlers) override {
        url_ = url;
        handlers_ = std::move(handlers);
        connected_ = true;
    }

    bool is_open() const override {
        return open_ && !closed_;
    }

    void send_json(const nlohmann::json& payload) override {
        if (!is_open()) {
            throw ConnectionClosedError("agent closed");
        }
        sent_.push_back(payload);
    }

    void close() override {
        closed_ = true;
        ++close_calls_;
    }

    void open() {
        open_ = true;
        if (handlers_.on_open) {
            handlers_.on_open();
        }
    }

    void deliver(const std::string& frame) {
        if (handlers_.on_message) {
            handlers_.on_message(frame);
        }
    }

    void deliver(const nlohmann::json& message) {
        deliver(message.dump());
    }

    void drop(const std::string& reason) {
        open_ = false;
        auto on_close = handlers_.on_close;
        if (on_close) {
            on_close(reason);
        }
    }

    const std::string& url() const { return url_; }
    bool connected() const { return connected_; }
    bool closed() const { return closed_; }
    int close_calls() const { return close_calls_; }
    const std::vector<nlohmann::json>& sent() const { return sent_; }

private:
    Handlers handlers_;
    std::string url_;
    bool connected_ = false;
    bool open_ = false;
    bool closed_ = false;
    int close_calls_ = 0;
    std::vector<nlohmann::json> sent_;
};

}
