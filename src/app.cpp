#include "voice_bridge/app.hpp"

#include <chrono>
#include <cstdint>
#include <thread>

#include "voice_bridge/agent/ws_client.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/async.hpp"

namespace voice_bridge {

namespace {

std::chrono::milliseconds to_millis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

}

VoiceBridgeApp::VoiceBridgeApp(Config config)
    : config_(std::move(config)),
      signed_url_fetcher_(config_.elevenlabs_api_url,
                          config_.elevenlabs_agent_id,
                          config_.elevenlabs_api_key,
                          to_millis(config_.ai_setup_timeout_sec)),
      twilio_client_(config_.twilio_api_url,
                     config_.twilio_account_sid,
                     config_.twilio_auth_token,
                     config_.twilio_phone_number,
                     to_millis(config_.twilio_request_timeout_sec)),
      outbound_(config_.public_host,
                [this](const std::string& to, const std::string& callback_url) {
                    return twilio_client_.create_call(to, callback_url);
                }) {}

VoiceBridgeApp::~VoiceBridgeApp() {
    stop();
}

void VoiceBridgeApp::init() {
    stream_server_ = std::make_unique<StreamServer>(
        config_, registry_,
        [this](std::shared_ptr<Channel> telephony) { return create_bridge(std::move(telephony)); });
    stream_server_->start();

    rest_server_ = std::make_unique<RestServer>(
        config_,
        [this](const nlohmann::json& body, const std::string& host) {
            return outbound_.handle_request(body, host);
        },
        [this](const std::string& prompt, const std::string& first_message,
               const std::string& host) {
            return outbound_.twiml(prompt, first_message, host);
        });
    rest_server_->start();
}

void VoiceBridgeApp::run() {
    while (!quitting_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    logging::info("Shutdown requested");
    stop();
}

void VoiceBridgeApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    quitting_ = true;
    if (rest_server_) {
        rest_server_->stop();
    }
    if (stream_server_) {
        stream_server_->stop();
    }
}

void VoiceBridgeApp::request_stop() {
    quitting_ = true;
}

const Config& VoiceBridgeApp::config() const {
    return config_;
}

std::shared_ptr<MediaBridge> VoiceBridgeApp::create_bridge(std::shared_ptr<Channel> telephony) {
    const auto open_timeout = to_millis(config_.ai_setup_timeout_sec);
    return std::make_shared<MediaBridge>(
        std::move(telephony),
        registry_,
        signed_url_fetcher_.provider(),
        [open_timeout]() { return std::make_unique<AgentWsClient>(open_timeout); },
        [](std::function<void()> task) { utils::run_async(std::move(task), "agent_setup"); },
        MediaBridge::Options{config_.default_prompt, config_.default_first_message});
}

}
