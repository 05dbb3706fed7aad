#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "voice_bridge/config.hpp"
#include "spdlog/logger.h"

namespace voice_bridge {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

// Context shared by every line a component logs, e.g. call_sid/stream_sid of a session.
using Fields = std::vector<KeyValue>;

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << value;
    return {key, oss.str()};
}

template <typename T>
inline KeyValue kv(const std::string& key, const std::optional<T>& value) {
    if (!value) {
        return {key, "-"};
    }
    return kv(key, *value);
}

inline KeyValue kv(const std::string& key, bool value) {
    return {key, value ? "true" : "false"};
}

inline void append_kv(std::string& out, const KeyValue& item) {
    if (!out.empty()) {
        out += ", ";
    }
    const bool needs_quotes = item.value.empty() ||
                              item.value.find_first_of(" =,\"") != std::string::npos;
    out += item.key;
    out += '=';
    if (!needs_quotes) {
        out += item.value;
        return;
    }
    out += '"';
    for (const char ch : item.value) {
        if (ch == '"') {
            out += '\\';
        }
        out += ch;
    }
    out += '"';
}

inline std::string with_kv(const std::string& message,
                           const Fields& base,
                           std::initializer_list<KeyValue> items) {
    std::string context;
    for (const auto& item : base) {
        append_kv(context, item);
    }
    for (const auto& item : items) {
        append_kv(context, item);
    }
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

inline std::string with_kv(const std::string& message,
                           std::initializer_list<KeyValue> items) {
    return with_kv(message, Fields{}, items);
}

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                const Fields& base,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, base, items));
    }
}

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    log(level, message, Fields{}, items);
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

}

using logging::kv;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
