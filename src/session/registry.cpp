#include "voice_bridge/session/registry.hpp"

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {

void ObserverRegistry::register_observer(const std::string& call_sid,
                                         std::shared_ptr<Channel> observer) {
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = observers_[call_sid];
        replaced = static_cast<bool>(slot);
        slot = std::move(observer);
    }
    logging::info(
        "Observer registered",
        {kv("call_sid", call_sid),
         kv("replaced", replaced)});
}

void ObserverRegistry::unregister(const std::string& call_sid) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(call_sid);
}

bool ObserverRegistry::unregister(const std::string& call_sid, const Channel* observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = observers_.find(call_sid);
    if (it == observers_.end() || it->second.get() != observer) {
        return false;
    }
    observers_.erase(it);
    return true;
}

std::shared_ptr<Channel> ObserverRegistry::lookup(const std::string& call_sid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = observers_.find(call_sid);
    if (it == observers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ObserverRegistry::send(const std::string& call_sid, const nlohmann::json& event) const {
    auto observer = lookup(call_sid);
    if (!observer || !observer->is_open()) {
        logging::warn(
            "No observer connected for call",
            {kv("call_sid", call_sid),
             kv("event", event.value("event", ""))});
        return false;
    }
    try {
        observer->send_text(event.dump());
    } catch (const ConnectionClosedError& ex) {
        logging::warn(
            "Observer send failed",
            {kv("call_sid", call_sid),
             kv("error", ex.what())});
        return false;
    }
    return true;
}

size_t ObserverRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

}
