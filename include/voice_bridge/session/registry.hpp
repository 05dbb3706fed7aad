#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "voice_bridge/session/channel.hpp"

namespace voice_bridge {

// Maps a call SID to the observer connection watching that call.
// Sessions only look entries up; attach/detach is driven by the observers.
class ObserverRegistry {
public:
    void register_observer(const std::string& call_sid, std::shared_ptr<Channel> observer);
    void unregister(const std::string& call_sid);
    // Removes the entry only while it still points at this observer.
    bool unregister(const std::string& call_sid, const Channel* observer);
    std::shared_ptr<Channel> lookup(const std::string& call_sid) const;
    // Returns false when nothing was delivered.
    bool send(const std::string& call_sid, const nlohmann::json& event) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Channel>> observers_;
};

}
