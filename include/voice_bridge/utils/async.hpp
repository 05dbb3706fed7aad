#pragma once

#include <functional>

namespace voice_bridge {
namespace utils {

// Runs the task on a detached thread. Exceptions escaping the task are logged.
void run_async(std::function<void()> task, const char* name = "async");

}
}
