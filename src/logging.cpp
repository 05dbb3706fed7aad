#include "voice_bridge/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

namespace voice_bridge::logging {

namespace {

constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] [%t] %v";

spdlog::level::level_enum level_from_config(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }
    // from_str maps unknown names to off; fall back to info instead.
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

std::vector<spdlog::sink_ptr> make_sinks(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!config.log_filename) {
        return sinks;
    }
    const std::filesystem::path file(*config.log_filename);
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path());
    }
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), true));
    return sinks;
}

}

void init(const Config& config) {
    const auto sinks = make_sinks(config);
    auto logger = std::make_shared<spdlog::logger>(config.log_name, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level_from_config(config.log_level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(config.log_name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> get_logger() {
    return spdlog::default_logger();
}

}
