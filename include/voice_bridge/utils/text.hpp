#pragma once

#include <string>

namespace voice_bridge::utils {

std::string xml_escape(const std::string& text);
std::string trim(const std::string& text);

}
